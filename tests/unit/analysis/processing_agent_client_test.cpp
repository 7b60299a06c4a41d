#include <gtest/gtest.h>

#include <memory>

#include "ocrflow_core/analysis/processing_agent_client.hpp"
#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/resilience/circuit_breaker.hpp"

namespace ocrflow_tests {

using namespace ocrflow_core;

TEST(ProcessingAgentClientTest, ParsesSuccessResponseAndScalesConfidence) {
  ChunkAnalysis analysis = ProcessingAgentClient::parse_response(
      R"({"status":"success","result":{"content":"Invoice #42","confidence":0.87,"model":"layout-v2"}})");
  EXPECT_EQ(analysis.content, "Invoice #42");
  EXPECT_NEAR(analysis.confidence, 87.0, 1e-9);
  EXPECT_EQ(analysis.model, "layout-v2");
}

TEST(ProcessingAgentClientTest, ConfidenceOutsideUnitRangeIsClamped) {
  auto high = ProcessingAgentClient::parse_response(
      R"({"status":"success","result":{"content":"x","confidence":3.5}})");
  auto low = ProcessingAgentClient::parse_response(
      R"({"status":"success","result":{"content":"x","confidence":-1}})");
  EXPECT_EQ(high.confidence, 100.0);
  EXPECT_EQ(low.confidence, 0.0);
}

TEST(ProcessingAgentClientTest, ErrorStatusIsToolFailure) {
  try {
    ProcessingAgentClient::parse_response(R"({"status":"error","message":"model overloaded"})");
    FAIL() << "expected ToolFailureError";
  } catch (const ToolFailureError& e) {
    EXPECT_NE(std::string(e.what()).find("model overloaded"), std::string::npos);
  }
}

TEST(ProcessingAgentClientTest, MalformedBodiesAreToolFailures) {
  EXPECT_THROW(ProcessingAgentClient::parse_response("not json"), ToolFailureError);
  EXPECT_THROW(ProcessingAgentClient::parse_response(R"({"status":"success"})"), ToolFailureError);
  EXPECT_THROW(ProcessingAgentClient::parse_response(R"({"status":"success","result":"text"})"),
               ToolFailureError);
}

TEST(ProcessingAgentClientTest, ValidationRequiresContentAndThreshold) {
  ProcessingAgentSettings settings;
  settings.confidence_threshold = 60.0;
  ProcessingAgentClient client(settings, std::make_shared<CircuitBreaker>("agent", CircuitBreakerSettings{}));

  EXPECT_TRUE(client.validate_result({"text", 60.0, "m"}));
  EXPECT_FALSE(client.validate_result({"text", 59.9, "m"}));
  EXPECT_FALSE(client.validate_result({"", 99.0, "m"}));
}

TEST(ProcessingAgentClientTest, RequiresBreaker) {
  EXPECT_THROW({ ProcessingAgentClient client(ProcessingAgentSettings{}, nullptr); },
               std::invalid_argument);
}

TEST(ProcessingAgentClientTest, UnreachableAgentTripsBreaker) {
  ProcessingAgentSettings settings;
  settings.base_url = "http://127.0.0.1:1";
  settings.timeout = std::chrono::milliseconds(2000);
  CircuitBreakerSettings breaker_settings;
  breaker_settings.failure_threshold = 2;
  auto breaker = std::make_shared<CircuitBreaker>("processing_agent", breaker_settings);
  ProcessingAgentClient client(settings, breaker);
  ChunkContext context{"job", "chunk_001_p1-20", "doc.pdf", 1, 20};

  EXPECT_THROW(client.analyze_chunk("/tmp/chunk.pdf", context), DownstreamUnavailableError);
  EXPECT_THROW(client.analyze_chunk("/tmp/chunk.pdf", context), DownstreamUnavailableError);
  EXPECT_EQ(breaker->state(), BreakerState::OPEN);
  EXPECT_THROW(client.analyze_chunk("/tmp/chunk.pdf", context), ServiceUnavailableError);

  AnalyzerMetrics metrics = client.metrics();
  EXPECT_EQ(metrics.analyzer, "processing_agent");
  EXPECT_EQ(metrics.total_requests, 3u);
  EXPECT_EQ(metrics.successful_requests, 0u);
  EXPECT_EQ(metrics.success_rate(), 0.0);
}

}  // namespace ocrflow_tests
