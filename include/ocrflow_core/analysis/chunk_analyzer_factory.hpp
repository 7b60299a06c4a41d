#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "ocrflow_core/analysis/processing_agent_client.hpp"

namespace ocrflow_core {

class ChunkAnalyzer;
class CircuitBreakerRegistry;
class OcrWorkerPool;
class PageRasterizer;

enum class AnalyzerKind { OCR, PROCESSING_AGENT };

AnalyzerKind analyzer_kind_from_string(const std::string &name);

struct AnalyzerDependencies {
  std::shared_ptr<PageRasterizer> rasterizer;
  std::shared_ptr<OcrWorkerPool> ocr;
  std::shared_ptr<CircuitBreakerRegistry> breakers;
  std::filesystem::path work_dir;
  int dpi = 200;
  ProcessingAgentSettings agent;
};

/**
 * @class ChunkAnalyzerFactory
 * @brief Builds the configured ChunkAnalyzer variant.
 *
 * The set of analyzers is closed: local OCR or the remote processing agent.
 */
class ChunkAnalyzerFactory {
 public:
  /**
   * @throws std::invalid_argument if a dependency the variant needs is missing.
   */
  static std::shared_ptr<ChunkAnalyzer> create(AnalyzerKind kind,
                                               const AnalyzerDependencies &deps);
};

}  // namespace ocrflow_core
