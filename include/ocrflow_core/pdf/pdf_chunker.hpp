#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "ocrflow_core/types/chunk.hpp"

namespace ocrflow_core {

class CommandRunner;
class PageRasterizer;
class StorageGuard;

struct ChunkerSettings {
  std::uintmax_t max_chunk_bytes = 50ull * 1024 * 1024;
  std::chrono::milliseconds tool_timeout{300000};
};

struct SplitResult {
  int total_pages = 0;
  std::vector<Chunk> chunks;
};

/**
 * @class PdfChunker
 * @brief Splits a PDF into overlapping page-range chunks, each its own PDF.
 *
 * Chunk files are written with qpdf. On any failure the chunk files already
 * written by the same split are removed before the error propagates.
 */
class PdfChunker {
 public:
  PdfChunker(std::shared_ptr<CommandRunner> runner, std::shared_ptr<PageRasterizer> rasterizer,
             std::shared_ptr<StorageGuard> storage, ChunkerSettings settings = {});

  /**
   * @brief Plans the page windows for a document.
   *
   * One window when total_pages <= chunk_size. Otherwise each window spans
   * chunk_size pages (the last may be shorter) and the next one starts
   * max(1, chunk_size - overlap) pages later, so windows overlap by
   * `overlap` pages and the plan always terminates.
   *
   * @throws InvalidInputError for chunk_size < 1, overlap < 0 or total_pages < 1.
   */
  static std::vector<PageWindow> plan_windows(int total_pages, int chunk_size, int overlap);

  /**
   * @throws InvalidDocumentError if the source cannot be read as a PDF.
   * @throws InsufficientStorageError if a chunk does not fit on disk.
   * @throws ChunkTooLargeError if a written chunk exceeds max_chunk_bytes.
   * @throws ConversionError if qpdf fails.
   */
  SplitResult split(const std::filesystem::path &pdf_path, int chunk_size, int overlap,
                    const std::filesystem::path &out_dir);

 private:
  Chunk write_chunk(const std::filesystem::path &pdf_path, const PageWindow &window, size_t index,
                    std::uintmax_t estimated_bytes, const std::filesystem::path &out_dir);

  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<PageRasterizer> rasterizer_;
  std::shared_ptr<StorageGuard> storage_;
  ChunkerSettings settings_;
};

}  // namespace ocrflow_core
