#include <gtest/gtest.h>

#include <stdexcept>

#include "mocks_test.hpp"
#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/resilience/circuit_breaker.hpp"
#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"

namespace ocrflow_tests {

using namespace ocrflow_core;
using std::chrono::milliseconds;

class CircuitBreakerTest : public ::testing::Test {
 protected:
  CircuitBreakerTest() {
    settings_.failure_threshold = 3;
    settings_.reset_timeout = milliseconds(1000);
    settings_.half_open_timeout = milliseconds(500);
  }

  std::unique_ptr<CircuitBreaker> make_breaker() {
    return std::make_unique<CircuitBreaker>("test", settings_, clock_.as_function());
  }

  void fail(CircuitBreaker& breaker) {
    EXPECT_THROW(breaker.execute([]() { throw ToolFailureError("boom"); }), ToolFailureError);
  }

  CircuitBreakerSettings settings_;
  ManualClock clock_;
};

TEST_F(CircuitBreakerTest, ConstructorRejectsZeroThreshold) {
  settings_.failure_threshold = 0;
  EXPECT_THROW(make_breaker(), std::invalid_argument);
}

TEST_F(CircuitBreakerTest, StartsClosedAndPassesResults) {
  auto breaker = make_breaker();
  EXPECT_EQ(breaker->state(), BreakerState::CLOSED);
  EXPECT_EQ(breaker->execute([]() { return 42; }), 42);
  EXPECT_EQ(breaker->consecutive_failures(), 0);
}

TEST_F(CircuitBreakerTest, OpensAfterThresholdConsecutiveFailures) {
  auto breaker = make_breaker();
  fail(*breaker);
  fail(*breaker);
  EXPECT_EQ(breaker->state(), BreakerState::CLOSED);
  fail(*breaker);
  EXPECT_EQ(breaker->state(), BreakerState::OPEN);
  EXPECT_EQ(breaker->trip_count(), 1u);
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureCount) {
  auto breaker = make_breaker();
  fail(*breaker);
  fail(*breaker);
  breaker->execute([]() {});
  EXPECT_EQ(breaker->consecutive_failures(), 0);
  fail(*breaker);
  fail(*breaker);
  EXPECT_EQ(breaker->state(), BreakerState::CLOSED);
}

TEST_F(CircuitBreakerTest, OpenCircuitRejectsWithoutCallingFunction) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);

  bool called = false;
  EXPECT_THROW(breaker->execute([&]() { called = true; }), ServiceUnavailableError);
  EXPECT_FALSE(called);
}

TEST_F(CircuitBreakerTest, RejectionMessageNamesTheService) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);
  try {
    breaker->execute([]() {});
    FAIL() << "expected ServiceUnavailableError";
  } catch (const ServiceUnavailableError& e) {
    EXPECT_NE(std::string(e.what()).find("'test'"), std::string::npos);
    EXPECT_EQ(e.kind(), ErrorKind::DownstreamUnavailable);
  }
}

TEST_F(CircuitBreakerTest, HalfOpenAfterResetTimeoutAndClosesOnSuccess) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);

  clock_.advance(milliseconds(999));
  EXPECT_FALSE(breaker->allow_request());

  clock_.advance(milliseconds(1));
  EXPECT_NO_THROW(breaker->execute([]() {}));
  EXPECT_EQ(breaker->state(), BreakerState::CLOSED);
  EXPECT_EQ(breaker->consecutive_failures(), 0);
}

TEST_F(CircuitBreakerTest, FailedProbeReopensCircuit) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);
  clock_.advance(milliseconds(1000));

  fail(*breaker);
  EXPECT_EQ(breaker->state(), BreakerState::OPEN);
  EXPECT_EQ(breaker->trip_count(), 2u);
  EXPECT_FALSE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsOnlyOneProbeAtATime) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);
  clock_.advance(milliseconds(1000));

  EXPECT_TRUE(breaker->allow_request());
  EXPECT_EQ(breaker->state(), BreakerState::HALF_OPEN);
  EXPECT_FALSE(breaker->allow_request());

  breaker->record_success();
  EXPECT_TRUE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, CallerErrorsDoNotCountAsFailures) {
  auto breaker = make_breaker();
  for (int i = 0; i < 5; ++i) {
    EXPECT_THROW(breaker->execute([]() { throw InvalidInputError("bad dpi"); }),
                 InvalidInputError);
  }
  EXPECT_EQ(breaker->state(), BreakerState::CLOSED);
  EXPECT_EQ(breaker->consecutive_failures(), 0);
}

TEST_F(CircuitBreakerTest, CallerErrorReleasesHalfOpenProbe) {
  auto breaker = make_breaker();
  for (int i = 0; i < 3; ++i) fail(*breaker);
  clock_.advance(milliseconds(1000));

  EXPECT_THROW(breaker->execute([]() { throw InvalidDocumentError("not a pdf"); }),
               InvalidDocumentError);
  EXPECT_EQ(breaker->state(), BreakerState::HALF_OPEN);
  EXPECT_TRUE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, StateNames) {
  EXPECT_EQ(to_string(BreakerState::CLOSED), "closed");
  EXPECT_EQ(to_string(BreakerState::OPEN), "open");
  EXPECT_EQ(to_string(BreakerState::HALF_OPEN), "half-open");
}

TEST(CircuitBreakerRegistryTest, ReturnsSameBreakerPerName) {
  CircuitBreakerRegistry registry(CircuitBreakerSettings{});
  auto first = registry.get(RASTERIZER_BREAKER);
  auto second = registry.get(RASTERIZER_BREAKER);
  auto other = registry.get(PROCESSING_AGENT_BREAKER);

  EXPECT_EQ(first.get(), second.get());
  EXPECT_NE(first.get(), other.get());
  EXPECT_EQ(first->name(), "rasterizer");
  EXPECT_EQ(registry.all().size(), 2u);
}

}  // namespace ocrflow_tests
