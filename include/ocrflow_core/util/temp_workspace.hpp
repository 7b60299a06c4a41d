#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ocrflow_core {

/**
 * @class TempWorkspace
 * @brief A per-job scratch directory that is removed when the object dies.
 *
 * Pages, chunk files and the uploaded source all live inside a workspace, so
 * every exit path (including exceptions) releases the job's disk usage.
 * release() hands ownership of the directory to someone else (a Job whose
 * finalization removes it).
 */
class TempWorkspace {
 public:
  TempWorkspace(const std::filesystem::path &root, const std::string &name);
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;
  TempWorkspace(TempWorkspace &&) = delete;
  TempWorkspace &operator=(TempWorkspace &&) = delete;

  const std::filesystem::path &path() const {
    return path_;
  }

  std::filesystem::path release();

  // Best-effort recursive delete; failures are logged, never thrown.
  static void remove_quietly(const std::filesystem::path &path);

 private:
  std::filesystem::path path_;
  bool owned_ = true;
};

/**
 * @class StorageGuard
 * @brief Checks free disk space under the work directory before writes.
 */
class StorageGuard {
 public:
  StorageGuard(std::filesystem::path root, std::uintmax_t min_free_bytes);
  virtual ~StorageGuard() = default;

  virtual std::uintmax_t available_bytes() const;

  // Throws InsufficientStorageError unless required + min_free bytes are available.
  void ensure_space(std::uintmax_t required_bytes) const;

  std::uintmax_t min_free_bytes() const {
    return min_free_bytes_;
  }

 private:
  std::filesystem::path root_;
  std::uintmax_t min_free_bytes_;
};

}  // namespace ocrflow_core
