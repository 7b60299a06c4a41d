#pragma once

#include <atomic>
#include <filesystem>
#include <memory>

#include "ocrflow_core/analysis/chunk_analyzer.hpp"

namespace ocrflow_core {

class PageRasterizer;
class OcrWorkerPool;

// Analyzes a chunk locally: rasterize its pages, then OCR them.
class OcrChunkAnalyzer : public ChunkAnalyzer {
 public:
  OcrChunkAnalyzer(std::shared_ptr<PageRasterizer> rasterizer, std::shared_ptr<OcrWorkerPool> ocr,
                   std::filesystem::path work_dir, int dpi);

  ChunkAnalysis analyze_chunk(const std::filesystem::path &file,
                              const ChunkContext &context) override;
  // Valid when at least some text was recognized.
  bool validate_result(const ChunkAnalysis &result) const override;
  AnalyzerMetrics metrics() const override;
  std::string name() const override {
    return "ocr";
  }

 private:
  std::shared_ptr<PageRasterizer> rasterizer_;
  std::shared_ptr<OcrWorkerPool> ocr_;
  std::filesystem::path work_dir_;
  int dpi_;
  std::atomic<std::uint64_t> total_requests_{0};
  std::atomic<std::uint64_t> successful_requests_{0};
};

}  // namespace ocrflow_core
