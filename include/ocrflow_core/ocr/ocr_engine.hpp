#pragma once

#include <string>

#include "ocrflow_core/types/page.hpp"

namespace ocrflow_core {

// Recognizes the text on one page image. Implementations must be safe to call
// from several worker threads at once.
class OcrEngine {
 public:
  virtual ~OcrEngine() = default;

  // Throws ToolFailureError when the page cannot be recognized.
  virtual OcrPageOutput recognize(const PageImage &page) = 0;
  virtual std::string name() const = 0;
};

}  // namespace ocrflow_core
