#include "ocrflow_core/metrics/service_metrics.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks_test.hpp"
#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"

using namespace ocrflow_core;
using namespace ocrflow_tests;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::NiceMock;
using ::testing::Return;

class ServiceMetricsTest : public ::testing::Test {
 protected:
  ServiceMetrics metrics_;
};

TEST_F(ServiceMetricsTest, FreshMetricsRenderZeroCounters) {
  std::string text = metrics_.render_prometheus();

  EXPECT_THAT(text, HasSubstr("# TYPE ocr_pdfs_processed_total counter\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pdfs_processed_total 0\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pdfs_failed_total 0\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pages_processed_total 0\n"));
  EXPECT_THAT(text, HasSubstr("ocr_jobs_in_progress 0\n"));
  EXPECT_THAT(text, Not(HasSubstr("ocr_circuit_breaker_state{")));
}

TEST_F(ServiceMetricsTest, CountersAccumulate) {
  metrics_.record_pdf_processed(1.5);
  metrics_.record_pdf_processed(0.5);
  metrics_.record_pdf_failed();
  metrics_.record_pages_processed(7);
  metrics_.record_pages_processed(3);
  metrics_.record_page_failed();
  metrics_.record_chunk(true);
  metrics_.record_chunk(false);
  metrics_.record_job_finished(true);

  EXPECT_EQ(metrics_.pdfs_processed(), 2u);
  EXPECT_EQ(metrics_.pdfs_failed(), 1u);
  EXPECT_EQ(metrics_.pages_processed(), 10u);
  EXPECT_EQ(metrics_.jobs_completed(), 1u);
  EXPECT_EQ(metrics_.jobs_failed(), 0u);

  std::string text = metrics_.render_prometheus();
  EXPECT_THAT(text, HasSubstr("ocr_pdfs_processed_total 2\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pdf_processing_seconds_total 2\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pages_processed_total 10\n"));
  EXPECT_THAT(text, HasSubstr("ocr_pages_failed_total 1\n"));
  EXPECT_THAT(text, HasSubstr("ocr_chunks_total{outcome=\"success\"} 1\n"));
  EXPECT_THAT(text, HasSubstr("ocr_chunks_total{outcome=\"error\"} 1\n"));
  EXPECT_THAT(text, HasSubstr("ocr_jobs_finished_total{status=\"completed\"} 1\n"));
}

TEST_F(ServiceMetricsTest, RequestsAndFailuresAreLabelled) {
  metrics_.record_request("extract");
  metrics_.record_request("extract");
  metrics_.record_request("upload");
  metrics_.record_failure("upload", ErrorKind::ResourceExhausted);

  std::string text = metrics_.render_prometheus();
  EXPECT_THAT(text, HasSubstr("ocr_http_requests_total{endpoint=\"extract\"} 2\n"));
  EXPECT_THAT(text, HasSubstr("ocr_http_requests_total{endpoint=\"upload\"} 1\n"));
  EXPECT_THAT(
      text,
      HasSubstr("ocr_http_failures_total{endpoint=\"upload\",kind=\"resource_exhausted\"} 1\n"));
}

TEST_F(ServiceMetricsTest, RendersAttachedPoolGauges) {
  auto pool = std::make_shared<async::WorkerPool>("ocr", 3, 10);
  metrics_.attach_pool(pool);

  std::string text = metrics_.render_prometheus();
  EXPECT_THAT(text, HasSubstr("ocr_queue_size{pool=\"ocr\"} 0\n"));
  EXPECT_THAT(text, HasSubstr("ocr_active_workers{pool=\"ocr\"} 0\n"));
  EXPECT_THAT(text, HasSubstr("ocr_parallel_workers{pool=\"ocr\"} 3\n"));
}

TEST_F(ServiceMetricsTest, RendersBreakerStateAsOneHotGauge) {
  CircuitBreakerSettings settings;
  settings.failure_threshold = 1;
  auto breakers = std::make_shared<CircuitBreakerRegistry>(settings);
  breakers->get("rasterizer")->record_failure();
  breakers->get("processing_agent");
  metrics_.attach_breakers(breakers);

  std::string text = metrics_.render_prometheus();
  EXPECT_THAT(text,
              HasSubstr("ocr_circuit_breaker_state{breaker=\"rasterizer\",state=\"open\"} 1\n"));
  EXPECT_THAT(
      text, HasSubstr("ocr_circuit_breaker_state{breaker=\"rasterizer\",state=\"closed\"} 0\n"));
  EXPECT_THAT(
      text,
      HasSubstr("ocr_circuit_breaker_state{breaker=\"processing_agent\",state=\"closed\"} 1\n"));
  EXPECT_THAT(text, HasSubstr("ocr_circuit_breaker_trips_total{breaker=\"rasterizer\"} 1\n"));
}

TEST_F(ServiceMetricsTest, RendersAnalyzerMetrics) {
  auto analyzer = std::make_shared<NiceMock<MockChunkAnalyzer>>();
  AnalyzerMetrics am;
  am.analyzer = "processing_agent";
  am.total_requests = 4;
  am.successful_requests = 3;
  ON_CALL(*analyzer, metrics()).WillByDefault(Return(am));
  metrics_.attach_analyzer(analyzer);

  std::string text = metrics_.render_prometheus();
  EXPECT_THAT(text, HasSubstr("ocr_analyzer_requests_total{analyzer=\"processing_agent\"} 4\n"));
  EXPECT_THAT(text, HasSubstr("ocr_analyzer_success_rate{analyzer=\"processing_agent\"} 0.75\n"));
}

TEST_F(ServiceMetricsTest, JobsInProgressCountsActiveExtractions) {
  auto progress = std::make_shared<ProgressTracker>();
  progress->start("job-aaaa-1111", 10);
  progress->start("job-bbbb-2222", 5);
  progress->mark_completed("job-bbbb-2222");
  metrics_.attach_progress(progress);

  EXPECT_THAT(metrics_.render_prometheus(), HasSubstr("ocr_jobs_in_progress 1\n"));
}
