#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "ocrflow_core/analysis/chunk_analyzer.hpp"

namespace ocrflow_core {

class CircuitBreaker;

struct ProcessingAgentSettings {
  std::string base_url = "http://localhost:8000";
  std::chrono::milliseconds timeout{120000};
  double confidence_threshold = 60.0;  // [0, 100]
};

/**
 * @class ProcessingAgentClient
 * @brief ChunkAnalyzer that delegates to the processing agent over HTTP.
 *
 * POSTs {"file_path", "context"} to <base_url>/process and expects
 * {"status": "success", "result": {"content", "confidence", "model"}}, with
 * confidence in [0, 1]. Every call goes through the processing_agent breaker.
 */
class ProcessingAgentClient : public ChunkAnalyzer {
 public:
  ProcessingAgentClient(ProcessingAgentSettings settings, std::shared_ptr<CircuitBreaker> breaker);

  ChunkAnalysis analyze_chunk(const std::filesystem::path &file,
                              const ChunkContext &context) override;
  // Content must be non-empty and confidence at least the threshold.
  bool validate_result(const ChunkAnalysis &result) const override;
  AnalyzerMetrics metrics() const override;
  std::string name() const override {
    return "processing_agent";
  }

  // Parses an agent response body; confidence is rescaled to [0, 100].
  static ChunkAnalysis parse_response(const std::string &body);

 private:
  std::string post_chunk(const std::string &payload);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);

  ProcessingAgentSettings settings_;
  std::shared_ptr<CircuitBreaker> breaker_;
  std::atomic<std::uint64_t> total_requests_{0};
  std::atomic<std::uint64_t> successful_requests_{0};
};

}  // namespace ocrflow_core
