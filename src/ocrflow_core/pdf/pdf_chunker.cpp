#include "ocrflow_core/pdf/pdf_chunker.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/pdf/page_rasterizer.hpp"
#include "ocrflow_core/util/command_runner.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

namespace fs = std::filesystem;

namespace {

std::string chunk_name(size_t index, const PageWindow &window) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "chunk_%03zu_p%d-%d", index + 1, window.start_page,
                window.end_page);
  return buffer;
}

void remove_chunk_files(const std::vector<Chunk> &chunks) {
  for (const auto &chunk : chunks) {
    std::error_code ec;
    fs::remove(chunk.file_path, ec);
    if (ec) {
      std::cerr << "[PdfChunker] Failed to remove " << chunk.file_path << ": " << ec.message()
                << std::endl;
    }
  }
}

}  // namespace

PdfChunker::PdfChunker(std::shared_ptr<CommandRunner> runner,
                       std::shared_ptr<PageRasterizer> rasterizer,
                       std::shared_ptr<StorageGuard> storage, ChunkerSettings settings)
    : runner_(std::move(runner)),
      rasterizer_(std::move(rasterizer)),
      storage_(std::move(storage)),
      settings_(settings) {}

std::vector<PageWindow> PdfChunker::plan_windows(int total_pages, int chunk_size, int overlap) {
  if (chunk_size < 1) {
    throw InvalidInputError("chunk_size must be at least 1");
  }
  if (overlap < 0) {
    throw InvalidInputError("overlap cannot be negative");
  }
  if (total_pages < 1) {
    throw InvalidInputError("document has no pages");
  }

  std::vector<PageWindow> windows;
  if (total_pages <= chunk_size) {
    windows.push_back({1, total_pages});
    return windows;
  }

  const int step = std::max(1, chunk_size - overlap);
  for (int start = 1;; start += step) {
    int end = std::min(start + chunk_size - 1, total_pages);
    windows.push_back({start, end});
    if (end == total_pages) {
      break;
    }
  }
  return windows;
}

SplitResult PdfChunker::split(const fs::path &pdf_path, int chunk_size, int overlap,
                              const fs::path &out_dir) {
  // Validate arguments before touching any tool.
  plan_windows(1, chunk_size, overlap);

  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    throw ToolFailureError("Failed to create chunk directory " + out_dir.string() + ": " +
                           ec.message());
  }

  DocumentInfo info = rasterizer_->read_document_info(pdf_path, out_dir);
  SplitResult result;
  result.total_pages = info.page_count;
  std::vector<PageWindow> windows = plan_windows(info.page_count, chunk_size, overlap);

  std::uintmax_t source_bytes = fs::file_size(pdf_path, ec);
  if (ec) {
    source_bytes = 0;
  }

  std::cout << "[PdfChunker] Splitting " << pdf_path.filename() << " (" << info.page_count
            << " pages) into " << windows.size() << " chunks" << std::endl;

  try {
    for (size_t i = 0; i < windows.size(); ++i) {
      std::uintmax_t estimated = source_bytes * static_cast<std::uintmax_t>(windows[i].page_count()) /
                                 static_cast<std::uintmax_t>(info.page_count);
      result.chunks.push_back(write_chunk(pdf_path, windows[i], i, estimated, out_dir));
    }
  } catch (...) {
    remove_chunk_files(result.chunks);
    throw;
  }
  return result;
}

Chunk PdfChunker::write_chunk(const fs::path &pdf_path, const PageWindow &window, size_t index,
                              std::uintmax_t estimated_bytes, const fs::path &out_dir) {
  storage_->ensure_space(estimated_bytes);

  Chunk chunk;
  chunk.id = chunk_name(index, window);
  chunk.file_path = out_dir / (chunk.id + ".pdf");
  chunk.start_page = window.start_page;
  chunk.end_page = window.end_page;

  std::string range = std::to_string(window.start_page) + "-" + std::to_string(window.end_page);
  CommandResult result = runner_->run(
      {"qpdf", "--empty", "--pages", pdf_path.string(), range, "--", chunk.file_path.string()},
      settings_.tool_timeout);

  // qpdf exits 3 when it succeeded with warnings.
  if (result.timed_out || (result.exit_code != 0 && result.exit_code != 3)) {
    std::error_code ec;
    fs::remove(chunk.file_path, ec);
    throw ConversionError("qpdf failed to write pages " + range +
                          (result.timed_out ? std::string(": timed out")
                                            : ": exit code " + std::to_string(result.exit_code)));
  }

  std::error_code ec;
  chunk.byte_size = fs::file_size(chunk.file_path, ec);
  if (ec || chunk.byte_size == 0) {
    throw ToolFailureError("qpdf reported success but chunk " + chunk.id + " is missing");
  }
  if (chunk.byte_size > settings_.max_chunk_bytes) {
    fs::remove(chunk.file_path, ec);
    throw ChunkTooLargeError("Chunk " + chunk.id + " is " + std::to_string(chunk.byte_size) +
                             " bytes, limit is " + std::to_string(settings_.max_chunk_bytes));
  }
  return chunk;
}

}  // namespace ocrflow_core
