#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace ocrflow_api {

class Config {
 public:
  std::string api_base_url;
  std::string work_dir;
  int http_threads;

  // Worker pools
  int ocr_workers;
  int chunk_workers;
  int max_queue_size;

  // Rendering and OCR
  int default_dpi;
  std::string tesseract_language;
  std::string tesseract_data_path;
  int tesseract_psm;

  // Chunking and limits
  int chunk_size_pages;
  int chunk_overlap_pages;
  std::uint64_t max_upload_bytes;
  std::uint64_t max_chunk_bytes;
  std::uint64_t min_free_bytes;

  // External tools
  int tool_timeout_ms;
  int page_probe_timeout_ms;
  int page_probe_max_pages;

  // Chunk analysis
  std::string chunk_analyzer;
  std::string processing_agent_url;
  int processing_agent_timeout_ms;
  double confidence_threshold;

  // Circuit breakers
  int breaker_failure_threshold;
  int breaker_reset_timeout_s;
  int breaker_half_open_timeout_s;

  int job_ttl_minutes;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("0.0.0.0:8001"));
      config.work_dir = json_config.value("work_dir", default_work_dir());
      config.http_threads = json_config.value("http_threads", 8);

      config.ocr_workers = json_config.value("ocr_workers", default_ocr_workers());
      config.chunk_workers = json_config.value("chunk_workers", 4);
      config.max_queue_size = json_config.value("max_queue_size", 100);

      config.default_dpi = json_config.value("default_dpi", 200);
      config.tesseract_language = json_config.value("tesseract_language", std::string("eng"));
      config.tesseract_data_path = json_config.value("tesseract_data_path", std::string());
      config.tesseract_psm = json_config.value("tesseract_psm", 3);

      config.chunk_size_pages = json_config.value("chunk_size_pages", 20);
      config.chunk_overlap_pages = json_config.value("chunk_overlap_pages", 2);
      config.max_upload_bytes =
          json_config.value("max_upload_bytes", std::uint64_t{100} * 1024 * 1024);
      config.max_chunk_bytes = json_config.value("max_chunk_bytes", std::uint64_t{50} * 1024 * 1024);
      config.min_free_bytes = json_config.value("min_free_bytes", std::uint64_t{512} * 1024 * 1024);

      config.tool_timeout_ms = json_config.value("tool_timeout_ms", 300000);
      config.page_probe_timeout_ms = json_config.value("page_probe_timeout_ms", 5000);
      config.page_probe_max_pages = json_config.value("page_probe_max_pages", 2000);

      config.chunk_analyzer = json_config.value("chunk_analyzer", std::string("ocr"));
      config.processing_agent_url =
          json_config.value("processing_agent_url", std::string("http://localhost:8000"));
      config.processing_agent_timeout_ms = json_config.value("processing_agent_timeout_ms", 120000);
      config.confidence_threshold = json_config.value("confidence_threshold", 60.0);

      config.breaker_failure_threshold = json_config.value("breaker_failure_threshold", 5);
      config.breaker_reset_timeout_s = json_config.value("breaker_reset_timeout_s", 60);
      config.breaker_half_open_timeout_s = json_config.value("breaker_half_open_timeout_s", 30);

      config.job_ttl_minutes = json_config.value("job_ttl_minutes", 60);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  static std::string default_work_dir() {
    const char *tmp = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    if (base.size() > 1 && base.back() == '/') {
      base.pop_back();
    }
    return base + "/ocr-work";
  }

  static int default_ocr_workers() {
    unsigned int cores = std::thread::hardware_concurrency();
    return static_cast<int>(std::min(32u, (cores == 0 ? 1u : cores) + 4u));
  }

  void validate() const {
    auto colon = api_base_url.find(':');
    if (api_base_url.empty() || colon == std::string::npos || colon + 1 >= api_base_url.size()) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    int parsed_port = 0;
    try {
      parsed_port = port();
    } catch (const std::exception &) {
      throw std::runtime_error("api_base_url has a non-numeric port");
    }
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("api_base_url port must be between 1 and 65535");
    }
    if (work_dir.empty()) {
      throw std::runtime_error("work_dir cannot be empty");
    }
    if (http_threads <= 0) {
      throw std::runtime_error("http_threads must be greater than 0");
    }
    if (ocr_workers <= 0) {
      throw std::runtime_error("ocr_workers must be greater than 0");
    }
    if (chunk_workers <= 0) {
      throw std::runtime_error("chunk_workers must be greater than 0");
    }
    if (max_queue_size <= 0) {
      throw std::runtime_error("max_queue_size must be greater than 0");
    }
    if (default_dpi < 50 || default_dpi > 600) {
      throw std::runtime_error("default_dpi must be between 50 and 600");
    }
    if (tesseract_language.empty()) {
      throw std::runtime_error("tesseract_language cannot be empty");
    }
    if (tesseract_psm < 0 || tesseract_psm > 13) {
      throw std::runtime_error("tesseract_psm must be between 0 and 13");
    }
    if (chunk_size_pages < 1) {
      throw std::runtime_error("chunk_size_pages must be at least 1");
    }
    if (chunk_overlap_pages < 0) {
      throw std::runtime_error("chunk_overlap_pages cannot be negative");
    }
    if (max_upload_bytes == 0 || max_chunk_bytes == 0) {
      throw std::runtime_error("max_upload_bytes and max_chunk_bytes must be greater than 0");
    }
    if (tool_timeout_ms < 1000) {
      throw std::runtime_error("tool_timeout_ms must be at least 1000ms");
    }
    if (page_probe_timeout_ms < 100) {
      throw std::runtime_error("page_probe_timeout_ms must be at least 100ms");
    }
    if (page_probe_max_pages < 1) {
      throw std::runtime_error("page_probe_max_pages must be at least 1");
    }
    if (chunk_analyzer != "ocr" && chunk_analyzer != "processing_agent") {
      throw std::runtime_error("chunk_analyzer must be 'ocr' or 'processing_agent'");
    }
    if (chunk_analyzer == "processing_agent" && processing_agent_url.empty()) {
      throw std::runtime_error("processing_agent_url cannot be empty");
    }
    if (processing_agent_timeout_ms < 1000) {
      throw std::runtime_error("processing_agent_timeout_ms must be at least 1000ms");
    }
    if (confidence_threshold < 0.0 || confidence_threshold > 100.0) {
      throw std::runtime_error("confidence_threshold must be between 0 and 100");
    }
    if (breaker_failure_threshold < 1) {
      throw std::runtime_error("breaker_failure_threshold must be at least 1");
    }
    if (breaker_reset_timeout_s < 1 || breaker_half_open_timeout_s < 0) {
      throw std::runtime_error("breaker timeouts must be positive");
    }
    if (breaker_half_open_timeout_s > breaker_reset_timeout_s) {
      throw std::runtime_error(
          "breaker_half_open_timeout_s must not exceed breaker_reset_timeout_s");
    }
    if (job_ttl_minutes < 1) {
      throw std::runtime_error("job_ttl_minutes must be at least 1 minute");
    }
  }
};

}  // namespace ocrflow_api
