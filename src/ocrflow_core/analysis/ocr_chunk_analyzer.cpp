#include "ocrflow_core/analysis/ocr_chunk_analyzer.hpp"

#include <iostream>

#include "ocrflow_core/ocr/ocr_worker_pool.hpp"
#include "ocrflow_core/pdf/page_rasterizer.hpp"
#include "ocrflow_core/util/identifiers.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

OcrChunkAnalyzer::OcrChunkAnalyzer(std::shared_ptr<PageRasterizer> rasterizer,
                                   std::shared_ptr<OcrWorkerPool> ocr,
                                   std::filesystem::path work_dir, int dpi)
    : rasterizer_(std::move(rasterizer)),
      ocr_(std::move(ocr)),
      work_dir_(std::move(work_dir)),
      dpi_(dpi) {
  PageRasterizer::validate_dpi(dpi_);
}

ChunkAnalysis OcrChunkAnalyzer::analyze_chunk(const std::filesystem::path &file,
                                              const ChunkContext &context) {
  total_requests_++;
  TempWorkspace workspace(work_dir_, "chunk-" + generate_uuid());

  RasterizedDocument document = rasterizer_->rasterize_file(file, dpi_, workspace.path());

  // Chunk PDFs restart at page 1; shift back to source numbering.
  const int offset = context.start_page > 0 ? context.start_page - 1 : 0;
  for (auto &page : document.pages) {
    page.page_number += offset;
  }

  size_t done = 0;
  std::vector<PageResult> pages =
      ocr_->process_document(document.pages, [&](size_t batch) {
        done += batch;
        std::cout << "[OcrChunkAnalyzer] " << context.chunk_id << ": " << done << "/"
                  << document.pages.size() << " pages" << std::endl;
      });

  ChunkAnalysis analysis;
  analysis.content = OcrWorkerPool::combine_text(pages);
  analysis.confidence = OcrWorkerPool::calculate_confidence(pages);
  analysis.model = "tesseract";
  successful_requests_++;
  return analysis;
}

bool OcrChunkAnalyzer::validate_result(const ChunkAnalysis &result) const {
  return result.content.find_first_not_of(" \t\r\n\f") != std::string::npos;
}

AnalyzerMetrics OcrChunkAnalyzer::metrics() const {
  return {name(), total_requests_.load(), successful_requests_.load()};
}

}  // namespace ocrflow_core
