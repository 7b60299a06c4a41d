#include "ocrflow_core/analysis/chunk_analyzer_factory.hpp"

#include <stdexcept>

#include "ocrflow_core/analysis/ocr_chunk_analyzer.hpp"
#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"

namespace ocrflow_core {

AnalyzerKind analyzer_kind_from_string(const std::string &name) {
  if (name == "ocr") {
    return AnalyzerKind::OCR;
  }
  if (name == "processing_agent") {
    return AnalyzerKind::PROCESSING_AGENT;
  }
  throw std::invalid_argument("Unknown chunk analyzer: " + name);
}

std::shared_ptr<ChunkAnalyzer> ChunkAnalyzerFactory::create(AnalyzerKind kind,
                                                            const AnalyzerDependencies &deps) {
  switch (kind) {
    case AnalyzerKind::OCR:
      if (!deps.rasterizer || !deps.ocr) {
        throw std::invalid_argument("OCR analyzer needs a rasterizer and an OCR pool");
      }
      return std::make_shared<OcrChunkAnalyzer>(deps.rasterizer, deps.ocr, deps.work_dir,
                                                deps.dpi);
    case AnalyzerKind::PROCESSING_AGENT:
      if (!deps.breakers) {
        throw std::invalid_argument("Processing agent analyzer needs a breaker registry");
      }
      return std::make_shared<ProcessingAgentClient>(deps.agent,
                                                     deps.breakers->get(PROCESSING_AGENT_BREAKER));
  }
  throw std::invalid_argument("Unsupported chunk analyzer kind");
}

}  // namespace ocrflow_core
