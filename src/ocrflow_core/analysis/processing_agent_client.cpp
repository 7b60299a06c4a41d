#include "ocrflow_core/analysis/processing_agent_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/resilience/circuit_breaker.hpp"

namespace ocrflow_core {

ProcessingAgentClient::ProcessingAgentClient(ProcessingAgentSettings settings,
                                             std::shared_ptr<CircuitBreaker> breaker)
    : settings_(std::move(settings)), breaker_(std::move(breaker)) {
  if (!breaker_) {
    throw std::invalid_argument("ProcessingAgentClient requires a circuit breaker");
  }
}

size_t ProcessingAgentClient::write_callback(void *contents, size_t size, size_t nmemb,
                                             std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

ChunkAnalysis ProcessingAgentClient::analyze_chunk(const std::filesystem::path &file,
                                                   const ChunkContext &context) {
  total_requests_++;

  nlohmann::json request = {{"file_path", file.string()},
                            {"context",
                             {{"job_id", context.job_id},
                              {"chunk_id", context.chunk_id},
                              {"file_name", context.file_name},
                              {"start_page", context.start_page},
                              {"end_page", context.end_page}}}};
  const std::string payload = request.dump();

  ChunkAnalysis analysis =
      breaker_->execute([&]() { return parse_response(post_chunk(payload)); });
  successful_requests_++;
  return analysis;
}

std::string ProcessingAgentClient::post_chunk(const std::string &payload) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw ToolFailureError("Failed to initialize CURL");
  }
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl, &curl_easy_cleanup);
  curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(headers,
                                                                          &curl_slist_free_all);

  const std::string url = settings_.base_url + "/process";
  std::string response_buffer;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(settings_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw DownstreamTimeoutError("Processing agent timed out after " +
                                 std::to_string(settings_.timeout.count()) + " ms");
  }
  if (res != CURLE_OK) {
    throw ServiceUnavailableError("Processing agent request failed: " +
                                  std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code >= 500) {
    throw ServiceUnavailableError("Processing agent returned HTTP " + std::to_string(http_code));
  }
  if (http_code != 200) {
    throw ToolFailureError("Processing agent rejected chunk with HTTP " +
                           std::to_string(http_code));
  }
  return response_buffer;
}

ChunkAnalysis ProcessingAgentClient::parse_response(const std::string &body) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    throw ToolFailureError(std::string("Processing agent returned invalid JSON: ") + e.what());
  }

  if (response.value("status", std::string()) != "success") {
    throw ToolFailureError("Processing agent error: " +
                           response.value("message", std::string("unknown error")));
  }
  if (!response.contains("result") || !response["result"].is_object()) {
    throw ToolFailureError("Processing agent response has no result");
  }

  const nlohmann::json &result = response["result"];
  ChunkAnalysis analysis;
  analysis.content = result.value("content", std::string());
  analysis.model = result.value("model", std::string());
  double raw = 0.0;
  if (result.contains("confidence") && result["confidence"].is_number()) {
    raw = result["confidence"].get<double>();
  }
  analysis.confidence = std::clamp(raw * 100.0, 0.0, 100.0);
  return analysis;
}

bool ProcessingAgentClient::validate_result(const ChunkAnalysis &result) const {
  if (result.content.empty()) {
    return false;
  }
  return result.confidence >= settings_.confidence_threshold;
}

AnalyzerMetrics ProcessingAgentClient::metrics() const {
  return {name(), total_requests_.load(), successful_requests_.load()};
}

}  // namespace ocrflow_core
