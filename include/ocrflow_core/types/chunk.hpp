#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ocrflow_core {

// Inclusive 1-based page range.
struct PageWindow {
  int start_page = 0;
  int end_page = 0;

  int page_count() const {
    return end_page - start_page + 1;
  }

  bool operator==(const PageWindow &other) const {
    return start_page == other.start_page && end_page == other.end_page;
  }
};

// A contiguous page range of a source PDF, written out as its own PDF file.
struct Chunk {
  std::string id;
  std::filesystem::path file_path;
  std::uintmax_t byte_size = 0;
  int start_page = 0;
  int end_page = 0;

  int page_count() const {
    return end_page - start_page + 1;
  }
};

struct ChunkResult {
  std::string chunk_id;
  int start_page = 0;
  int end_page = 0;
  std::string content;
  double confidence = 0.0;  // [0, 100]
  std::optional<std::string> error;
};

}  // namespace ocrflow_core
