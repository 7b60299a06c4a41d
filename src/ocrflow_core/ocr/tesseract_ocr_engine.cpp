#include "ocrflow_core/ocr/tesseract_ocr_engine.hpp"

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

#include <memory>

#include "ocrflow_core/errors.hpp"

namespace ocrflow_core {

namespace {

struct PixDeleter {
  void operator()(Pix *pix) const {
    pixDestroy(&pix);
  }
};

struct TessApiDeleter {
  void operator()(tesseract::TessBaseAPI *api) const {
    api->End();
    delete api;
  }
};

}  // namespace

TesseractOcrEngine::TesseractOcrEngine(TesseractSettings settings)
    : settings_(std::move(settings)) {}

OcrPageOutput TesseractOcrEngine::recognize(const PageImage &page) {
  std::unique_ptr<tesseract::TessBaseAPI, TessApiDeleter> api(new tesseract::TessBaseAPI());
  const char *data_path = settings_.data_path.empty() ? nullptr : settings_.data_path.c_str();
  if (api->Init(data_path, settings_.language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
    throw ToolFailureError("Could not initialize Tesseract for language '" + settings_.language +
                           "'");
  }
  api->SetPageSegMode(static_cast<tesseract::PageSegMode>(settings_.page_segmentation_mode));

  std::unique_ptr<Pix, PixDeleter> image(pixRead(page.path.c_str()));
  if (!image) {
    throw ToolFailureError("Could not read image for page " + std::to_string(page.page_number) +
                           ": " + page.path.string());
  }
  api->SetImage(image.get());

  std::unique_ptr<char[]> text(api->GetUTF8Text());
  if (!text) {
    throw ToolFailureError("Tesseract returned no text for page " +
                           std::to_string(page.page_number));
  }

  OcrPageOutput output;
  output.text = text.get();
  output.confidence = static_cast<double>(api->MeanTextConf());
  return output;
}

}  // namespace ocrflow_core
