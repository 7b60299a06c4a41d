#include "ocrflow_core/util/temp_workspace.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

#include "ocrflow_core/errors.hpp"

namespace ocrflow_core {

namespace fs = std::filesystem;

TempWorkspace::TempWorkspace(const fs::path &root, const std::string &name)
    : path_(root / name) {
  std::error_code ec;
  fs::create_directories(path_, ec);
  if (ec) {
    throw ToolFailureError("Failed to create workspace " + path_.string() + ": " + ec.message());
  }
}

TempWorkspace::~TempWorkspace() {
  if (owned_) {
    remove_quietly(path_);
  }
}

fs::path TempWorkspace::release() {
  owned_ = false;
  return path_;
}

void TempWorkspace::remove_quietly(const fs::path &path) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    std::cerr << "[TempWorkspace] Failed to remove " << path << ": " << ec.message()
              << std::endl;
  }
}

StorageGuard::StorageGuard(fs::path root, std::uintmax_t min_free_bytes)
    : root_(std::move(root)), min_free_bytes_(min_free_bytes) {}

std::uintmax_t StorageGuard::available_bytes() const {
  std::error_code ec;
  fs::create_directories(root_, ec);
  fs::space_info info = fs::space(root_, ec);
  if (ec) {
    throw ToolFailureError("Failed to query free space for " + root_.string() + ": " +
                           ec.message());
  }
  return info.available;
}

void StorageGuard::ensure_space(std::uintmax_t required_bytes) const {
  std::uintmax_t available = available_bytes();
  if (available < required_bytes + min_free_bytes_) {
    throw InsufficientStorageError("Insufficient storage: need " +
                                   std::to_string(required_bytes) + " bytes plus " +
                                   std::to_string(min_free_bytes_) + " reserved, " +
                                   std::to_string(available) + " available");
  }
}

}  // namespace ocrflow_core
