#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace ocrflow_core {

class JobOrchestrator;
class PdfChunker;
class StorageGuard;

struct UploadSettings {
  std::filesystem::path work_dir;
  std::uintmax_t max_upload_bytes = 100ull * 1024 * 1024;
  int chunk_size_pages = 20;
  int chunk_overlap_pages = 2;
};

struct UploadResult {
  std::string job_id;
  std::string file_name;
  int total_pages = 0;
  int total_chunks = 0;
};

/**
 * @class UploadService
 * @brief Asynchronous pipeline behind POST /upload.
 *
 * Stores the PDF in a fresh workspace, splits it into chunks and hands the
 * chunks to the orchestrator. From then on the job owns the workspace.
 */
class UploadService {
 public:
  UploadService(std::shared_ptr<PdfChunker> chunker, std::shared_ptr<JobOrchestrator> orchestrator,
                std::shared_ptr<StorageGuard> storage, UploadSettings settings);

  /**
   * @throws InvalidInputError / InvalidDocumentError for bad uploads.
   * @throws FileTooLargeError, ChunkTooLargeError, InsufficientStorageError on limits.
   * @throws QueueFullError if the chunk executor cannot take the job.
   */
  UploadResult upload(const std::string &file_name, const std::string &content);

 private:
  std::shared_ptr<PdfChunker> chunker_;
  std::shared_ptr<JobOrchestrator> orchestrator_;
  std::shared_ptr<StorageGuard> storage_;
  UploadSettings settings_;
};

}  // namespace ocrflow_core
