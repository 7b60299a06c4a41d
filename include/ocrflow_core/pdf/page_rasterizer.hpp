#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ocrflow_core/types/page.hpp"

namespace ocrflow_core {

class CommandRunner;
class CircuitBreaker;

struct RasterizerSettings {
  std::chrono::milliseconds tool_timeout{300000};
  std::chrono::milliseconds page_probe_timeout{5000};
  int page_probe_max_pages = 2000;
};

struct DocumentInfo {
  int page_count = 0;
  std::map<std::string, std::string> metadata;
};

struct RasterizedDocument {
  int page_count = 0;
  std::map<std::string, std::string> metadata;
  std::vector<PageImage> pages;
};

/**
 * @class PageRasterizer
 * @brief Turns a PDF into one PNG per page using poppler's command line tools.
 *
 * pdfinfo validates the file and supplies metadata and the page count; if the
 * count is missing, pages are probed one by one. pdftoppm then renders every
 * page in a single run guarded by the rasterizer circuit breaker. Output
 * images are located by their deterministic names, never by polling.
 */
class PageRasterizer {
 public:
  static constexpr int MIN_DPI = 50;
  static constexpr int MAX_DPI = 600;
  static constexpr int DEFAULT_DPI = 200;

  PageRasterizer(std::shared_ptr<CommandRunner> runner, std::shared_ptr<CircuitBreaker> breaker,
                 RasterizerSettings settings = {});
  virtual ~PageRasterizer() = default;

  /**
   * @brief Writes pdf_bytes to <workspace>/input.pdf and rasterizes it.
   * @throws InvalidInputError for a dpi outside [MIN_DPI, MAX_DPI].
   * @throws InvalidDocumentError if the bytes are not a readable PDF.
   * @throws ConversionError if pdftoppm fails, times out or renders nothing.
   * @throws ServiceUnavailableError if the rasterizer circuit is open.
   */
  virtual RasterizedDocument rasterize(const std::string &pdf_bytes, int dpi,
                                       const std::filesystem::path &workspace);

  // Same as rasterize() for a PDF that is already on disk.
  virtual RasterizedDocument rasterize_file(const std::filesystem::path &pdf_path, int dpi,
                                            const std::filesystem::path &workspace);

  // Runs pdfinfo and falls back to probing when it reports no page count.
  virtual DocumentInfo read_document_info(const std::filesystem::path &pdf_path,
                                          const std::filesystem::path &workspace);

  int probe_page_count(const std::filesystem::path &pdf_path,
                       const std::filesystem::path &workspace);

  static void validate_dpi(int dpi);
  static bool looks_like_pdf(const std::string &bytes);
  static std::map<std::string, std::string> parse_pdfinfo_output(const std::string &output);
  // pdftoppm names pages <prefix>-<n>.png, zero-padded to the digits of the page count.
  static std::filesystem::path expected_page_path(const std::filesystem::path &prefix, int page,
                                                  int page_count);

 private:
  std::shared_ptr<CommandRunner> runner_;
  std::shared_ptr<CircuitBreaker> breaker_;
  RasterizerSettings settings_;
};

}  // namespace ocrflow_core
