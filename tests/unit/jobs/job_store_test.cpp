#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/jobs/job_store.hpp"

namespace ocrflow_tests {

using namespace ocrflow_core;

namespace {

std::vector<Chunk> make_chunks(int count) {
  std::vector<Chunk> chunks;
  for (int i = 0; i < count; ++i) {
    Chunk chunk;
    chunk.id = "chunk_" + std::to_string(i + 1);
    chunk.start_page = i * 10 + 1;
    chunk.end_page = i * 10 + 10;
    chunk.file_path = "/tmp/" + chunk.id + ".pdf";
    chunks.push_back(chunk);
  }
  return chunks;
}

ChunkResult result_for(const Chunk& chunk, std::optional<std::string> error = std::nullopt) {
  ChunkResult result;
  result.chunk_id = chunk.id;
  result.start_page = chunk.start_page;
  result.end_page = chunk.end_page;
  result.content = error ? "" : "text of " + chunk.id;
  result.confidence = error ? 0.0 : 80.0;
  result.error = std::move(error);
  return result;
}

}  // namespace

TEST(JobStoreTest, CreateRegistersProcessingJob) {
  JobStore store;
  std::string id = store.create("report.pdf", make_chunks(3));

  auto job = store.get(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->file_name, "report.pdf");
  EXPECT_EQ(job->status, JobStatus::PROCESSING);
  EXPECT_EQ(job->total_chunks, 3);
  EXPECT_EQ(job->completed_chunks, 0);
  EXPECT_EQ(id.size(), 36u);
}

TEST(JobStoreTest, CreateRejectsEmptyChunkList) {
  JobStore store;
  EXPECT_THROW(store.create("empty.pdf", {}), InvalidInputError);
}

TEST(JobStoreTest, UnknownJobIsNotFound) {
  JobStore store;
  EXPECT_FALSE(store.get("missing").has_value());
  EXPECT_THROW(store.record_chunk_outcome("missing", ChunkResult{}), JobNotFoundError);
}

TEST(JobStoreTest, LastChunkFinalizesWithSortedResults) {
  JobStore store;
  auto chunks = make_chunks(3);
  std::string id = store.create("doc.pdf", chunks, "/tmp/ws");

  EXPECT_FALSE(store.record_chunk_outcome(id, result_for(chunks[2])).finalized);
  EXPECT_FALSE(store.record_chunk_outcome(id, result_for(chunks[0])).finalized);
  ChunkOutcome last = store.record_chunk_outcome(id, result_for(chunks[1]));

  EXPECT_TRUE(last.finalized);
  EXPECT_EQ(last.status, JobStatus::COMPLETED);
  EXPECT_EQ(last.chunks_to_release.size(), 3u);
  EXPECT_EQ(last.workspace, "/tmp/ws");

  auto job = store.get(id);
  ASSERT_EQ(job->results.size(), 3u);
  EXPECT_EQ(job->results[0].start_page, 1);
  EXPECT_EQ(job->results[1].start_page, 11);
  EXPECT_EQ(job->results[2].start_page, 21);
  EXPECT_EQ(job->status, JobStatus::COMPLETED);
}

TEST(JobStoreTest, ErrorFlipsStatusImmediatelyAndKeepsFirstMessage) {
  JobStore store;
  auto chunks = make_chunks(3);
  std::string id = store.create("doc.pdf", chunks);

  store.record_chunk_outcome(id, result_for(chunks[0], std::string("agent timeout")));
  auto job = store.get(id);
  EXPECT_EQ(job->status, JobStatus::ERROR);
  ASSERT_TRUE(job->error_message.has_value());
  EXPECT_NE(job->error_message->find("agent timeout"), std::string::npos);
  EXPECT_NE(job->error_message->find("pages 1-10"), std::string::npos);

  store.record_chunk_outcome(id, result_for(chunks[1], std::string("second failure")));
  ChunkOutcome last = store.record_chunk_outcome(id, result_for(chunks[2]));

  EXPECT_TRUE(last.finalized);
  EXPECT_EQ(last.status, JobStatus::ERROR);
  job = store.get(id);
  EXPECT_EQ(job->error_message->find("second failure"), std::string::npos);
  EXPECT_EQ(job->results.size(), 3u);
  EXPECT_NEAR(job->confidence(), 80.0 / 3.0, 1e-9);
}

TEST(JobStoreTest, RecordingBeyondTotalIsALogicError) {
  JobStore store;
  auto chunks = make_chunks(1);
  std::string id = store.create("doc.pdf", chunks);
  store.record_chunk_outcome(id, result_for(chunks[0]));
  EXPECT_THROW(store.record_chunk_outcome(id, result_for(chunks[0])), std::logic_error);
}

TEST(JobStoreTest, ConcurrentOutcomesFinalizeExactlyOnce) {
  for (int round = 0; round < 20; ++round) {
    JobStore store;
    auto chunks = make_chunks(16);
    std::string id = store.create("doc.pdf", chunks);
    std::atomic<int> finalized{0};

    std::vector<std::thread> threads;
    for (const auto& chunk : chunks) {
      threads.emplace_back([&, chunk] {
        if (store.record_chunk_outcome(id, result_for(chunk)).finalized) {
          finalized++;
        }
      });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(finalized.load(), 1);
    auto job = store.get(id);
    EXPECT_EQ(job->completed_chunks, 16);
    EXPECT_EQ(job->status, JobStatus::COMPLETED);
    for (size_t i = 1; i < job->results.size(); ++i) {
      EXPECT_LT(job->results[i - 1].start_page, job->results[i].start_page);
    }
  }
}

TEST(JobStoreTest, EvictsConsumedJobsButNeverInFlightOnes) {
  JobStore store;
  auto chunks = make_chunks(2);
  std::string done = store.create("done.pdf", chunks);
  std::string running = store.create("running.pdf", chunks);
  store.record_chunk_outcome(done, result_for(chunks[0]));
  store.record_chunk_outcome(done, result_for(chunks[1]));
  // Errored but still has a chunk outstanding
  store.record_chunk_outcome(running, result_for(chunks[0], std::string("boom")));

  store.mark_consumed(running);
  EXPECT_TRUE(store.evict_expired(std::chrono::minutes(60)).empty());

  store.mark_consumed(done);
  auto evicted = store.evict_expired(std::chrono::minutes(60));
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0].id, done);
  EXPECT_TRUE(store.contains(running));
  EXPECT_EQ(store.in_flight(), 1u);
}

TEST(JobStoreTest, EvictsUnreadJobsOnceTtlHasPassed) {
  JobStore store;
  auto chunks = make_chunks(1);
  std::string id = store.create("doc.pdf", chunks);
  store.record_chunk_outcome(id, result_for(chunks[0]));

  EXPECT_TRUE(store.evict_expired(std::chrono::minutes(60)).empty());
  EXPECT_EQ(store.evict_expired(std::chrono::minutes(-1)).size(), 1u);
  EXPECT_EQ(store.size(), 0u);
}

TEST(JobStoreTest, CountsByStatus) {
  JobStore store;
  auto chunks = make_chunks(1);
  std::string ok = store.create("a.pdf", chunks);
  std::string bad = store.create("b.pdf", chunks);
  store.create("c.pdf", chunks);
  store.record_chunk_outcome(ok, result_for(chunks[0]));
  store.record_chunk_outcome(bad, result_for(chunks[0], std::string("x")));

  EXPECT_EQ(store.count(JobStatus::COMPLETED), 1u);
  EXPECT_EQ(store.count(JobStatus::ERROR), 1u);
  EXPECT_EQ(store.count(JobStatus::PROCESSING), 1u);
  EXPECT_EQ(store.in_flight(), 1u);
}

TEST(JobStatusTest, RoundTripsWireNames) {
  EXPECT_EQ(to_string(JobStatus::PROCESSING), "processing");
  EXPECT_EQ(to_string(JobStatus::COMPLETED), "completed");
  EXPECT_EQ(to_string(JobStatus::ERROR), "error");
  EXPECT_EQ(job_status_from_string("error"), JobStatus::ERROR);
  EXPECT_THROW(job_status_from_string("done"), std::invalid_argument);
}

}  // namespace ocrflow_tests
