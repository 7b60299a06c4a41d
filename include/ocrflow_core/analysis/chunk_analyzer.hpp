#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ocrflow_core {

struct ChunkContext {
  std::string job_id;
  std::string chunk_id;
  std::string file_name;
  int start_page = 0;
  int end_page = 0;
};

struct ChunkAnalysis {
  std::string content;
  double confidence = 0.0;  // [0, 100]
  std::string model;
};

struct AnalyzerMetrics {
  std::string analyzer;
  std::uint64_t total_requests = 0;
  std::uint64_t successful_requests = 0;

  double success_rate() const {
    return total_requests == 0 ? 0.0
                               : static_cast<double>(successful_requests) /
                                     static_cast<double>(total_requests);
  }
};

/**
 * @class ChunkAnalyzer
 * @brief Turns one chunk PDF into text plus a confidence score.
 *
 * Implementations are called concurrently from the chunk executor.
 */
class ChunkAnalyzer {
 public:
  virtual ~ChunkAnalyzer() = default;

  virtual ChunkAnalysis analyze_chunk(const std::filesystem::path &file,
                                      const ChunkContext &context) = 0;
  // False marks the chunk as failed even though analysis returned.
  virtual bool validate_result(const ChunkAnalysis &result) const = 0;
  virtual AnalyzerMetrics metrics() const = 0;
  virtual std::string name() const = 0;
};

}  // namespace ocrflow_core
