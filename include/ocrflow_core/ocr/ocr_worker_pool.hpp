#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "ocrflow_core/types/page.hpp"

namespace ocrflow_core {

class OcrEngine;
namespace async {
class WorkerPool;
}

// Called once per finished batch with the number of pages in that batch.
using OcrProgressCallback = std::function<void(std::size_t)>;

/**
 * @class OcrWorkerPool
 * @brief Runs OCR over a document's pages on a shared worker pool.
 *
 * Pages go out in batches of worker_count(); each batch runs concurrently
 * and is awaited before on_progress is called and the next batch starts.
 * A page that fails is recorded with an error and confidence 0, the rest of
 * the document carries on.
 */
class OcrWorkerPool {
 public:
  OcrWorkerPool(std::shared_ptr<OcrEngine> engine, std::shared_ptr<async::WorkerPool> workers);

  /**
   * @brief OCRs every page and returns the results ordered by page number.
   * @throws std::invalid_argument if on_progress is empty.
   */
  std::vector<PageResult> process_document(const std::vector<PageImage> &pages,
                                           const OcrProgressCallback &on_progress);

  // Recognizes a single page on the calling thread; never throws for engine failures.
  PageResult process_page(const PageImage &page) const;

  size_t batch_size() const;

  // Mean page confidence; failed pages count as 0 and no pages gives 0.
  static double calculate_confidence(const std::vector<PageResult> &results);
  static std::string combine_text(const std::vector<PageResult> &results);
  static double clamp_confidence(double confidence);

 private:
  std::shared_ptr<OcrEngine> engine_;
  std::shared_ptr<async::WorkerPool> workers_;
};

}  // namespace ocrflow_core
