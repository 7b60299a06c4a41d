#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ocrflow_core {

// A rendered page image inside a job workspace. page_number is 1-based.
struct PageImage {
  int page_number = 0;
  std::filesystem::path path;
};

// Raw output of one OCR engine call.
struct OcrPageOutput {
  std::string text;
  double confidence = 0.0;
};

struct PageResult {
  int page_number = 0;
  std::string text;
  double confidence = 0.0;  // [0, 100]
  std::optional<std::string> error;
};

}  // namespace ocrflow_core
