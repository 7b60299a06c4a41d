#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>

#include "ocrflow_api/config.hpp"

using ocrflow_api::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/ocrflow_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"work_dir", "/var/lib/ocrflow"},
      {"ocr_workers", 6},
      {"chunk_workers", 2},
      {"default_dpi", 300},
      {"chunk_size_pages", 10},
      {"chunk_overlap_pages", 1},
      {"chunk_analyzer", "processing_agent"},
      {"processing_agent_url", "http://agent:9000"},
      {"job_ttl_minutes", 15}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.work_dir, "/var/lib/ocrflow");
  EXPECT_EQ(cfg.ocr_workers, 6);
  EXPECT_EQ(cfg.chunk_workers, 2);
  EXPECT_EQ(cfg.default_dpi, 300);
  EXPECT_EQ(cfg.chunk_size_pages, 10);
  EXPECT_EQ(cfg.chunk_overlap_pages, 1);
  EXPECT_EQ(cfg.chunk_analyzer, "processing_agent");
  EXPECT_EQ(cfg.processing_agent_url, "http://agent:9000");
  EXPECT_EQ(cfg.job_ttl_minutes, 15);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8001");
  EXPECT_FALSE(cfg.work_dir.empty());
  EXPECT_EQ(cfg.http_threads, 8);
  EXPECT_GE(cfg.ocr_workers, 5);
  EXPECT_LE(cfg.ocr_workers, 32);
  EXPECT_EQ(cfg.chunk_workers, 4);
  EXPECT_EQ(cfg.max_queue_size, 100);
  EXPECT_EQ(cfg.default_dpi, 200);
  EXPECT_EQ(cfg.tesseract_language, "eng");
  EXPECT_EQ(cfg.chunk_size_pages, 20);
  EXPECT_EQ(cfg.chunk_overlap_pages, 2);
  EXPECT_EQ(cfg.max_upload_bytes, 100ull * 1024 * 1024);
  EXPECT_EQ(cfg.max_chunk_bytes, 50ull * 1024 * 1024);
  EXPECT_EQ(cfg.chunk_analyzer, "ocr");
  EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 60.0);
  EXPECT_EQ(cfg.breaker_failure_threshold, 5);
  EXPECT_EQ(cfg.breaker_reset_timeout_s, 60);
  EXPECT_EQ(cfg.breaker_half_open_timeout_s, 30);
  EXPECT_EQ(cfg.job_ttl_minutes, 60);
}

TEST(ConfigTest, HostAndPort) {
  Config cfg = Config::from_json({{"api_base_url", "127.0.0.1:9090"}});
  EXPECT_EQ(cfg.host(), "127.0.0.1");
  EXPECT_EQ(cfg.port(), 9090);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "work_dir": "/tmp/ocrflow-work",
    "ocr_workers": 2,
    "max_upload_bytes": 1048576
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.port(), 4000);
  EXPECT_EQ(cfg.work_dir, "/tmp/ocrflow-work");
  EXPECT_EQ(cfg.ocr_workers, 2);
  EXPECT_EQ(cfg.max_upload_bytes, 1048576u);
}

TEST(ConfigTest, FromFileThrowsOnMissingFile) {
  EXPECT_THROW(Config::from_file("/nonexistent/path/ocrflowrc.json"), std::runtime_error);
}

TEST(ConfigTest, FromFileThrowsOnMalformedJson) {
  std::string path = write_temp_file("{ \"api_base_url\": ");
  EXPECT_THROW(Config::from_file(path), std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, RejectsNonObject) {
  EXPECT_THROW(Config::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST(ConfigTest, RejectsWrongValueType) {
  EXPECT_THROW(Config::from_json({{"ocr_workers", "many"}}), std::runtime_error);
}

TEST(ConfigTest, ValidatesAddress) {
  EXPECT_THROW(Config::from_json({{"api_base_url", "localhost"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"api_base_url", "localhost:"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"api_base_url", "localhost:http"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"api_base_url", "localhost:70000"}}), std::runtime_error);
}

TEST(ConfigTest, ValidatesWorkersAndLimits) {
  EXPECT_THROW(Config::from_json({{"ocr_workers", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_workers", -1}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"max_queue_size", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"default_dpi", 10}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"default_dpi", 1200}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_size_pages", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_overlap_pages", -2}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"max_upload_bytes", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"tool_timeout_ms", 10}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"job_ttl_minutes", 0}}), std::runtime_error);
}

TEST(ConfigTest, ValidatesAnalyzerSelection) {
  EXPECT_THROW(Config::from_json({{"chunk_analyzer", "gpt"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_analyzer", "processing_agent"},
                                  {"processing_agent_url", ""}}),
               std::runtime_error);
  EXPECT_NO_THROW(Config::from_json({{"chunk_analyzer", "ocr"}, {"processing_agent_url", ""}}));
  EXPECT_THROW(Config::from_json({{"confidence_threshold", 101.0}}), std::runtime_error);
}

TEST(ConfigTest, ValidatesBreakerSettings) {
  EXPECT_THROW(Config::from_json({{"breaker_failure_threshold", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"breaker_reset_timeout_s", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"breaker_reset_timeout_s", 10},
                                  {"breaker_half_open_timeout_s", 20}}),
               std::runtime_error);
  EXPECT_NO_THROW(Config::from_json({{"breaker_reset_timeout_s", 10},
                                     {"breaker_half_open_timeout_s", 10}}));
}
