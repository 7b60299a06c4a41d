#pragma once

#include <string>

#include "ocrflow_core/ocr/ocr_engine.hpp"

namespace ocrflow_core {

struct TesseractSettings {
  std::string language = "eng";
  std::string data_path;  // empty: library default tessdata location
  int page_segmentation_mode = 3;
};

/**
 * @class TesseractOcrEngine
 * @brief OcrEngine backed by libtesseract (LSTM engine) and Leptonica.
 *
 * A TessBaseAPI instance is not thread-safe, so each recognize() call builds
 * its own. The page confidence is TessBaseAPI::MeanTextConf() in [0, 100].
 */
class TesseractOcrEngine : public OcrEngine {
 public:
  explicit TesseractOcrEngine(TesseractSettings settings);

  OcrPageOutput recognize(const PageImage &page) override;
  std::string name() const override {
    return "tesseract";
  }

 private:
  TesseractSettings settings_;
};

}  // namespace ocrflow_core
