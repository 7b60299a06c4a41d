#include "ocrflow_core/pdf/page_rasterizer.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/resilience/circuit_breaker.hpp"
#include "ocrflow_core/util/command_runner.hpp"

namespace ocrflow_core {

namespace fs = std::filesystem;

namespace {

const char *const METADATA_FIELDS[] = {"Title",    "Author",    "Creator",  "Producer",
                                       "File size", "Pages",    "Page size", "PDF version"};

bool non_empty_file(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::string first_line(const std::string &output) {
  std::string line = trim(output.substr(0, output.find('\n')));
  return line.empty() ? "no output" : line;
}

}  // namespace

PageRasterizer::PageRasterizer(std::shared_ptr<CommandRunner> runner,
                               std::shared_ptr<CircuitBreaker> breaker,
                               RasterizerSettings settings)
    : runner_(std::move(runner)), breaker_(std::move(breaker)), settings_(settings) {}

void PageRasterizer::validate_dpi(int dpi) {
  if (dpi < MIN_DPI || dpi > MAX_DPI) {
    throw InvalidInputError("DPI must be between " + std::to_string(MIN_DPI) + " and " +
                            std::to_string(MAX_DPI) + ", got " + std::to_string(dpi));
  }
}

bool PageRasterizer::looks_like_pdf(const std::string &bytes) {
  // Readers accept the header anywhere in the first 1024 bytes.
  auto pos = bytes.find("%PDF-");
  return pos != std::string::npos && pos < 1024;
}

std::map<std::string, std::string> PageRasterizer::parse_pdfinfo_output(
    const std::string &output) {
  std::map<std::string, std::string> fields;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string key = trim(line.substr(0, colon));
    for (const char *field : METADATA_FIELDS) {
      if (key == field) {
        std::string value = trim(line.substr(colon + 1));
        if (!value.empty()) {
          fields[key] = value;
        }
        break;
      }
    }
  }
  return fields;
}

fs::path PageRasterizer::expected_page_path(const fs::path &prefix, int page, int page_count) {
  std::string number = std::to_string(page);
  size_t width = std::to_string(page_count).size();
  if (number.size() < width) {
    number.insert(0, width - number.size(), '0');
  }
  fs::path path = prefix;
  path += "-" + number + ".png";
  return path;
}

RasterizedDocument PageRasterizer::rasterize(const std::string &pdf_bytes, int dpi,
                                             const fs::path &workspace) {
  validate_dpi(dpi);
  if (pdf_bytes.empty() || !looks_like_pdf(pdf_bytes)) {
    throw InvalidDocumentError("Uploaded file is not a PDF document");
  }

  fs::path pdf_path = workspace / "input.pdf";
  {
    std::ofstream out(pdf_path, std::ios::binary);
    if (!out) {
      throw ToolFailureError("Failed to open " + pdf_path.string() + " for writing");
    }
    out.write(pdf_bytes.data(), static_cast<std::streamsize>(pdf_bytes.size()));
    if (!out) {
      throw ToolFailureError("Failed to write " + pdf_path.string());
    }
  }
  return rasterize_file(pdf_path, dpi, workspace);
}

RasterizedDocument PageRasterizer::rasterize_file(const fs::path &pdf_path, int dpi,
                                                  const fs::path &workspace) {
  validate_dpi(dpi);
  DocumentInfo info = read_document_info(pdf_path, workspace);

  fs::path prefix = workspace / "page";
  std::vector<std::string> argv = {"pdftoppm", "-png",  "-r",         std::to_string(dpi),
                                   "-aa",      "yes",   "-cropbox",   pdf_path.string(),
                                   prefix.string()};

  std::cout << "[PageRasterizer] Rendering " << info.page_count << " pages of " << pdf_path
            << " at " << dpi << " DPI" << std::endl;

  breaker_->execute([&]() {
    CommandResult result = runner_->run(argv, settings_.tool_timeout);
    if (result.timed_out) {
      throw ConversionError("pdftoppm timed out after " +
                            std::to_string(settings_.tool_timeout.count()) + " ms");
    }
    if (result.exit_code != 0) {
      throw ConversionError("pdftoppm failed with exit code " + std::to_string(result.exit_code) +
                            ": " + first_line(result.output));
    }
  });

  RasterizedDocument document;
  document.page_count = info.page_count;
  document.metadata = std::move(info.metadata);
  for (int page = 1; page <= document.page_count; ++page) {
    fs::path path = expected_page_path(prefix, page, document.page_count);
    if (!non_empty_file(path)) {
      std::cerr << "[PageRasterizer] Missing image for page " << page << " (" << path << ")"
                << std::endl;
      continue;
    }
    document.pages.push_back(PageImage{page, path});
  }

  if (document.pages.empty()) {
    throw ConversionError("pdftoppm produced no page images for " + pdf_path.filename().string());
  }
  return document;
}

DocumentInfo PageRasterizer::read_document_info(const fs::path &pdf_path,
                                                const fs::path &workspace) {
  CommandResult result = runner_->run({"pdfinfo", pdf_path.string()}, settings_.tool_timeout);
  if (result.timed_out) {
    throw ToolFailureError("pdfinfo timed out on " + pdf_path.filename().string());
  }
  if (result.exit_code != 0) {
    throw InvalidDocumentError("Invalid PDF file: " + first_line(result.output));
  }

  DocumentInfo info;
  info.metadata = parse_pdfinfo_output(result.output);
  if (info.metadata.empty()) {
    throw InvalidDocumentError("Invalid PDF file: pdfinfo reported no document fields");
  }

  auto pages = info.metadata.find("Pages");
  if (pages != info.metadata.end()) {
    try {
      info.page_count = std::stoi(pages->second);
    } catch (const std::exception &) {
      info.page_count = 0;
    }
  }
  if (info.page_count <= 0) {
    std::cout << "[PageRasterizer] Page count not found in metadata, probing pages..."
              << std::endl;
    info.page_count = probe_page_count(pdf_path, workspace);
    info.metadata["Pages"] = std::to_string(info.page_count);
  }
  return info;
}

int PageRasterizer::probe_page_count(const fs::path &pdf_path, const fs::path &workspace) {
  int count = 0;
  for (int page = 1; page <= settings_.page_probe_max_pages; ++page) {
    fs::path prefix = workspace / ("probe-" + std::to_string(page));
    fs::path output = prefix;
    output += ".png";

    CommandResult result = runner_->run({"pdftoppm", "-f", std::to_string(page), "-l",
                                         std::to_string(page), "-png", "-r", "10", "-singlefile",
                                         pdf_path.string(), prefix.string()},
                                        settings_.page_probe_timeout);
    bool rendered = result.succeeded() && non_empty_file(output);
    std::error_code ec;
    fs::remove(output, ec);
    if (!rendered) {
      break;
    }
    count = page;
  }

  if (count == 0) {
    throw InvalidDocumentError("Invalid PDF file: first page could not be rendered");
  }
  if (count == settings_.page_probe_max_pages) {
    std::cerr << "[PageRasterizer] Page probe stopped at the cap of " << count << " pages"
              << std::endl;
  }
  return count;
}

}  // namespace ocrflow_core
