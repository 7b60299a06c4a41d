#include "ocrflow_core/jobs/job_janitor.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "ocrflow_core/jobs/job_store.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "utilities_test.hpp"

using namespace ocrflow_core;
using namespace ocrflow_tests;
using namespace std::chrono_literals;

class JobJanitorTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    jobs_ = std::make_shared<JobStore>();
    progress_ = std::make_shared<ProgressTracker>();
  }

  // Creates a one-chunk job whose workspace holds a file, optionally completed.
  std::string create_job(const std::string& name, bool complete) {
    std::filesystem::path workspace = temp_dir_ / name;
    TestUtilities::write_file(workspace / "source.pdf", "%PDF-1.4");

    Chunk chunk;
    chunk.id = "chunk_1";
    chunk.start_page = 1;
    chunk.end_page = 5;
    chunk.file_path = workspace / "chunk_1.pdf";
    std::string id = jobs_->create(name + ".pdf", {chunk}, workspace);

    if (complete) {
      ChunkResult result;
      result.chunk_id = chunk.id;
      result.start_page = 1;
      result.end_page = 5;
      result.content = "text";
      result.confidence = 90.0;
      jobs_->record_chunk_outcome(id, result);
    }
    return id;
  }

  std::shared_ptr<JobStore> jobs_;
  std::shared_ptr<ProgressTracker> progress_;
};

TEST_F(JobJanitorTest, SweepEvictsConsumedJobsAndRemovesWorkspace) {
  std::string id = create_job("consumed", true);
  jobs_->mark_consumed(id);

  JobJanitor janitor(jobs_, progress_, 60min);
  EXPECT_EQ(janitor.sweep(), 1u);

  EXPECT_FALSE(jobs_->contains(id));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "consumed"));
}

TEST_F(JobJanitorTest, SweepKeepsUnreadJobsWithinTtl) {
  std::string id = create_job("fresh", true);

  JobJanitor janitor(jobs_, progress_, 60min);
  EXPECT_EQ(janitor.sweep(), 0u);
  EXPECT_TRUE(jobs_->contains(id));
}

TEST_F(JobJanitorTest, SweepEvictsJobsPastTtl) {
  std::string id = create_job("stale", true);
  std::this_thread::sleep_for(5ms);

  JobJanitor janitor(jobs_, progress_, 0min);
  EXPECT_EQ(janitor.sweep(), 1u);
  EXPECT_FALSE(jobs_->contains(id));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "stale"));
}

TEST_F(JobJanitorTest, SweepNeverEvictsJobsInFlight) {
  std::string id = create_job("running", false);
  std::this_thread::sleep_for(5ms);

  JobJanitor janitor(jobs_, progress_, 0min);
  EXPECT_EQ(janitor.sweep(), 0u);
  EXPECT_TRUE(jobs_->contains(id));
  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "running" / "source.pdf"));
}

TEST_F(JobJanitorTest, BackgroundThreadSweepsPeriodically) {
  std::string id = create_job("background", true);
  jobs_->mark_consumed(id);

  JobJanitor janitor(jobs_, progress_, 60min, 20ms);
  janitor.start();

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (jobs_->contains(id) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  janitor.stop();

  EXPECT_FALSE(jobs_->contains(id));
}

TEST_F(JobJanitorTest, StartTwiceThrows) {
  JobJanitor janitor(jobs_, progress_, 60min, 1s);
  janitor.start();
  EXPECT_THROW(janitor.start(), std::runtime_error);
  janitor.stop();
}

TEST_F(JobJanitorTest, StopWithoutStartIsSafe) {
  JobJanitor janitor(jobs_, progress_, 60min);
  EXPECT_NO_THROW(janitor.stop());
}
