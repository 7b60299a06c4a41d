#include "utilities_test.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "ocrflow_core/pdf/page_rasterizer.hpp"

namespace ocrflow_tests {

namespace fs = std::filesystem;

fs::path TestUtilities::create_temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  fs::path dir = fs::temp_directory_path() /
                 (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void TestUtilities::remove_temp_dir(const fs::path& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestUtilities::write_file(const fs::path& path, const std::string& contents) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to write test file " + path.string());
  }
  out << contents;
}

std::string TestUtilities::read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string TestUtilities::minimal_pdf_bytes(size_t padding) {
  std::string pdf = "%PDF-1.4\n1 0 obj\n<< /Type /Catalog >>\nendobj\n";
  pdf.append(padding, ' ');
  pdf += "\n%%EOF\n";
  return pdf;
}

std::string TestUtilities::pdfinfo_output(int pages, const std::string& title) {
  std::ostringstream out;
  out << "Title:          " << title << "\n"
      << "Creator:        ocrflow tests\n"
      << "Producer:       ocrflow tests\n"
      << "Tagged:         no\n"
      << "Pages:          " << pages << "\n"
      << "Page size:      612 x 792 pts (letter)\n"
      << "File size:      1024 bytes\n"
      << "PDF version:    1.4\n";
  return out.str();
}

ocrflow_core::CommandResult TestUtilities::ok(const std::string& output) {
  ocrflow_core::CommandResult result;
  result.exit_code = 0;
  result.output = output;
  return result;
}

ocrflow_core::CommandResult TestUtilities::failed(int exit_code, const std::string& output) {
  ocrflow_core::CommandResult result;
  result.exit_code = exit_code;
  result.output = output;
  return result;
}

ocrflow_core::CommandResult TestUtilities::timed_out() {
  ocrflow_core::CommandResult result;
  result.exit_code = -1;
  result.timed_out = true;
  return result;
}

void TestUtilities::write_page_images(const std::string& prefix, int page_count,
                                      const std::vector<int>& skip_pages) {
  for (int page = 1; page <= page_count; ++page) {
    bool skip = false;
    for (int skipped : skip_pages) {
      skip = skip || skipped == page;
    }
    if (!skip) {
      write_file(ocrflow_core::PageRasterizer::expected_page_path(prefix, page, page_count),
                 "PNG page " + std::to_string(page));
    }
  }
}

void TestUtilities::write_qpdf_output(const std::vector<std::string>& argv, size_t bytes) {
  write_file(argv.back(), std::string(bytes, 'x'));
}

}  // namespace ocrflow_tests
