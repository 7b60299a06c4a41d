#include "ocrflow_core/ocr/ocr_worker_pool.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>

#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/ocr/ocr_engine.hpp"

namespace ocrflow_core {

OcrWorkerPool::OcrWorkerPool(std::shared_ptr<OcrEngine> engine,
                             std::shared_ptr<async::WorkerPool> workers)
    : engine_(std::move(engine)), workers_(std::move(workers)) {
  if (!engine_ || !workers_) {
    throw std::invalid_argument("OcrWorkerPool requires an engine and a worker pool");
  }
}

size_t OcrWorkerPool::batch_size() const {
  return std::max<size_t>(1, workers_->worker_count());
}

double OcrWorkerPool::clamp_confidence(double confidence) {
  if (std::isnan(confidence)) {
    return 0.0;
  }
  return std::clamp(confidence, 0.0, 100.0);
}

PageResult OcrWorkerPool::process_page(const PageImage &page) const {
  PageResult result;
  result.page_number = page.page_number;
  try {
    OcrPageOutput output = engine_->recognize(page);
    result.text = std::move(output.text);
    result.confidence = clamp_confidence(output.confidence);
  } catch (const std::exception &e) {
    std::cerr << "[OcrWorkerPool] Error processing page " << page.page_number << ": " << e.what()
              << std::endl;
    result.text.clear();
    result.confidence = 0.0;
    result.error = e.what();
  }
  return result;
}

std::vector<PageResult> OcrWorkerPool::process_document(const std::vector<PageImage> &pages,
                                                        const OcrProgressCallback &on_progress) {
  if (!on_progress) {
    throw std::invalid_argument("process_document requires a progress callback");
  }

  std::vector<PageResult> results;
  results.reserve(pages.size());
  const size_t batch = batch_size();

  for (size_t start = 0; start < pages.size(); start += batch) {
    size_t end = std::min(start + batch, pages.size());

    std::vector<std::future<PageResult>> futures;
    futures.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      const PageImage page = pages[i];
      futures.push_back(workers_->submit([this, page]() { return process_page(page); }));
    }
    for (auto &future : futures) {
      results.push_back(future.get());
    }
    on_progress(end - start);
  }

  std::stable_sort(results.begin(), results.end(), [](const PageResult &a, const PageResult &b) {
    return a.page_number < b.page_number;
  });
  return results;
}

double OcrWorkerPool::calculate_confidence(const std::vector<PageResult> &results) {
  if (results.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &result : results) {
    total += result.error ? 0.0 : result.confidence;
  }
  return clamp_confidence(total / static_cast<double>(results.size()));
}

std::string OcrWorkerPool::combine_text(const std::vector<PageResult> &results) {
  std::string combined;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      combined += '\n';
    }
    combined += results[i].text;
  }
  return combined;
}

}  // namespace ocrflow_core
