#include "ocrflow_core/services/upload_service.hpp"

#include <fstream>
#include <iostream>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/jobs/job_orchestrator.hpp"
#include "ocrflow_core/pdf/page_rasterizer.hpp"
#include "ocrflow_core/pdf/pdf_chunker.hpp"
#include "ocrflow_core/services/extraction_service.hpp"
#include "ocrflow_core/util/identifiers.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

UploadService::UploadService(std::shared_ptr<PdfChunker> chunker,
                             std::shared_ptr<JobOrchestrator> orchestrator,
                             std::shared_ptr<StorageGuard> storage, UploadSettings settings)
    : chunker_(std::move(chunker)),
      orchestrator_(std::move(orchestrator)),
      storage_(std::move(storage)),
      settings_(std::move(settings)) {}

UploadResult UploadService::upload(const std::string &file_name, const std::string &content) {
  if (!ExtractionService::has_pdf_extension(file_name)) {
    throw InvalidInputError("Only PDF files are supported");
  }
  if (content.empty()) {
    throw InvalidInputError("Uploaded file is empty");
  }
  if (content.size() > settings_.max_upload_bytes) {
    throw FileTooLargeError("File exceeds the " + std::to_string(settings_.max_upload_bytes) +
                            " byte upload limit");
  }
  if (!PageRasterizer::looks_like_pdf(content)) {
    throw InvalidDocumentError("Uploaded file is not a PDF document");
  }
  // The source plus its chunks, which together hold roughly the source again.
  storage_->ensure_space(content.size() * 2);

  TempWorkspace workspace(settings_.work_dir, "upload-" + generate_uuid());
  std::filesystem::path source = workspace.path() / "source.pdf";
  {
    std::ofstream out(source, std::ios::binary);
    if (!out) {
      throw ToolFailureError("Failed to open " + source.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
      throw ToolFailureError("Failed to write " + source.string());
    }
  }

  SplitResult split = chunker_->split(source, settings_.chunk_size_pages,
                                      settings_.chunk_overlap_pages, workspace.path() / "chunks");

  UploadResult result;
  result.file_name = file_name;
  result.total_pages = split.total_pages;
  result.total_chunks = static_cast<int>(split.chunks.size());
  result.job_id = orchestrator_->create_job(file_name, split.chunks, workspace.path());
  workspace.release();

  orchestrator_->submit_chunks(result.job_id, split.chunks);
  std::cout << "[UploadService] Job " << result.job_id << ": queued " << result.total_chunks
            << " chunks covering " << result.total_pages << " pages" << std::endl;
  return result;
}

}  // namespace ocrflow_core
