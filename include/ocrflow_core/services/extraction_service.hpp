#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ocrflow_core {

class OcrWorkerPool;
class PageRasterizer;
class ProgressTracker;
class ServiceMetrics;
class StorageGuard;

struct ExtractionSettings {
  std::filesystem::path work_dir;
  int default_dpi = 200;
  std::uintmax_t max_upload_bytes = 100ull * 1024 * 1024;
};

struct ExtractionRequest {
  std::string file_name;
  std::string content;
  std::optional<int> dpi;
  // Client-chosen id so progress can be polled while the request runs.
  std::optional<std::string> job_id;
};

struct ExtractionResult {
  std::string job_id;
  std::string text;
  double confidence = 0.0;
  int num_pages = 0;
  int failed_pages = 0;
  double processing_time_seconds = 0.0;
  int dpi = 0;
  size_t workers = 0;
  std::string content_hash;
  std::map<std::string, std::string> document_info;
};

/**
 * @class ExtractionService
 * @brief Synchronous PDF-to-text pipeline behind POST /extract.
 *
 * Validates the upload, rasterizes it into a per-job workspace, OCRs the
 * pages batch by batch while publishing progress, and returns the combined
 * text with its document confidence. The workspace is gone when extract()
 * returns or throws.
 */
class ExtractionService {
 public:
  ExtractionService(std::shared_ptr<PageRasterizer> rasterizer, std::shared_ptr<OcrWorkerPool> ocr,
                    std::shared_ptr<ProgressTracker> progress,
                    std::shared_ptr<ServiceMetrics> metrics, std::shared_ptr<StorageGuard> storage,
                    ExtractionSettings settings);

  /**
   * @throws InvalidInputError for a non-PDF name, empty content, bad dpi or job id.
   * @throws FileTooLargeError above max_upload_bytes.
   * @throws InsufficientStorageError if the work directory is short on space.
   * @throws InvalidDocumentError, ConversionError, ServiceUnavailableError from rasterization.
   */
  ExtractionResult extract(const ExtractionRequest &request);

  static bool has_pdf_extension(const std::string &file_name);

 private:
  std::shared_ptr<PageRasterizer> rasterizer_;
  std::shared_ptr<OcrWorkerPool> ocr_;
  std::shared_ptr<ProgressTracker> progress_;
  std::shared_ptr<ServiceMetrics> metrics_;
  std::shared_ptr<StorageGuard> storage_;
  ExtractionSettings settings_;
};

}  // namespace ocrflow_core
