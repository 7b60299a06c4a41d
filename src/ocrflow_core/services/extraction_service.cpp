#include "ocrflow_core/services/extraction_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/metrics/service_metrics.hpp"
#include "ocrflow_core/ocr/ocr_worker_pool.hpp"
#include "ocrflow_core/pdf/page_rasterizer.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "ocrflow_core/util/identifiers.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

ExtractionService::ExtractionService(std::shared_ptr<PageRasterizer> rasterizer,
                                     std::shared_ptr<OcrWorkerPool> ocr,
                                     std::shared_ptr<ProgressTracker> progress,
                                     std::shared_ptr<ServiceMetrics> metrics,
                                     std::shared_ptr<StorageGuard> storage,
                                     ExtractionSettings settings)
    : rasterizer_(std::move(rasterizer)),
      ocr_(std::move(ocr)),
      progress_(std::move(progress)),
      metrics_(std::move(metrics)),
      storage_(std::move(storage)),
      settings_(std::move(settings)) {}

bool ExtractionService::has_pdf_extension(const std::string &file_name) {
  if (file_name.size() < 4) {
    return false;
  }
  std::string extension = file_name.substr(file_name.size() - 4);
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".pdf";
}

ExtractionResult ExtractionService::extract(const ExtractionRequest &request) {
  if (!has_pdf_extension(request.file_name)) {
    throw InvalidInputError("Only PDF files are supported");
  }
  if (request.content.empty()) {
    throw InvalidInputError("Uploaded file is empty");
  }
  if (request.content.size() > settings_.max_upload_bytes) {
    throw FileTooLargeError("File exceeds the " + std::to_string(settings_.max_upload_bytes) +
                            " byte upload limit");
  }
  const int dpi = request.dpi.value_or(settings_.default_dpi);
  PageRasterizer::validate_dpi(dpi);

  std::string job_id;
  if (request.job_id) {
    if (!is_valid_job_id(*request.job_id)) {
      throw InvalidInputError("Invalid job id: " + *request.job_id);
    }
    if (!progress_->try_start(*request.job_id, 0)) {
      throw InvalidInputError("Job id already in use: " + *request.job_id);
    }
    job_id = *request.job_id;
  } else {
    job_id = generate_uuid();
    progress_->start(job_id, 0);
  }

  const auto started = std::chrono::steady_clock::now();
  std::cout << "[ExtractionService] Job " << job_id << ": extracting " << request.file_name
            << " (" << request.content.size() << " bytes, " << dpi << " DPI)" << std::endl;

  try {
    // Source copy plus rendered pages; PNGs at high DPI dwarf the PDF itself.
    storage_->ensure_space(request.content.size() * 4);
    TempWorkspace workspace(settings_.work_dir, "extract-" + job_id);

    RasterizedDocument document = rasterizer_->rasterize(request.content, dpi, workspace.path());
    progress_->set_total(job_id, document.pages.size());

    std::vector<PageResult> pages =
        ocr_->process_document(document.pages, [&](size_t batch) {
          progress_->add_processed(job_id, batch);
          metrics_->record_pages_processed(batch);
        });

    ExtractionResult result;
    result.job_id = job_id;
    result.text = OcrWorkerPool::combine_text(pages);
    result.confidence = OcrWorkerPool::calculate_confidence(pages);
    result.num_pages = document.page_count;
    result.failed_pages = static_cast<int>(
        std::count_if(pages.begin(), pages.end(), [](const PageResult &p) { return p.error; }));
    result.dpi = dpi;
    result.workers = ocr_->batch_size();
    result.content_hash = sha256_hex(request.content);
    result.document_info = std::move(document.metadata);
    result.processing_time_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    for (int i = 0; i < result.failed_pages; ++i) {
      metrics_->record_page_failed();
    }
    metrics_->record_pdf_processed(result.processing_time_seconds);
    progress_->mark_completed(job_id);

    std::cout << "[ExtractionService] Job " << job_id << ": " << result.num_pages << " pages in "
              << result.processing_time_seconds << "s, confidence " << result.confidence
              << std::endl;
    return result;
  } catch (const std::exception &e) {
    std::cerr << "[ExtractionService] Job " << job_id << " failed: " << e.what() << std::endl;
    progress_->mark_error(job_id, e.what());
    metrics_->record_pdf_failed();
    throw;
  }
}

}  // namespace ocrflow_core
