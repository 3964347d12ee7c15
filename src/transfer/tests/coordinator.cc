#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "base/config.h"
#include "transfer/block_id.h"
#include "transfer/coordinator.h"
#include "transfer/errors.h"
#include "transfer/tests/memory_services.h"
#include "transfer/worker_engine.h"

namespace dxfer {
namespace transfer {
namespace tests {

namespace {
const char JOB_QUEUE[] = "jobs";
const char STATUS_QUEUE[] = "status";
const char CONTAINER[] = "container";
const char BLOB[] = "blob";

UploadRequest MakeUpload(uint32_t total_units, uint32_t instances) {
  UploadRequest request;

  request.unit_size = 64;
  request.total_units = total_units;
  request.instances = instances;
  request.object_name = BLOB;
  request.container_name = CONTAINER;
  return request;
}

DownloadRequest MakeDownload(uint64_t chunk_size, uint32_t instances) {
  DownloadRequest request;

  request.chunk_size = chunk_size;
  request.instances = instances;
  request.object_name = BLOB;
  request.container_name = CONTAINER;
  return request;
}

std::vector<std::string> Ids(size_t count) {
  std::vector<std::string> ids;
  for (size_t i = 0; i < count; i++) ids.push_back("id-" + std::to_string(i));
  return ids;
}

class CoordinatorTest : public TransferTest {
 protected:
  CoordinatorTest()
      : job_channel_(&queue_, JOB_QUEUE),
        status_channel_(&queue_, STATUS_QUEUE),
        coordinator_(&store_, &job_channel_, &status_channel_, "coord") {}

  // Each worker takes exactly one job, then exits.
  void StartWorkers(int count) {
    for (int i = 0; i < count; i++) {
      engines_.emplace_back(new WorkerEngine(&store_, &job_channel_,
                                             &status_channel_, 2,
                                             "worker-" + std::to_string(i)));
    }

    for (auto &e : engines_) {
      WorkerEngine *engine = e.get();
      threads_.emplace_back([engine]() { engine->Run(1); });
    }
  }

  void JoinWorkers() {
    for (auto &t : threads_) t.join();
    threads_.clear();
  }

  void TearDown() override {
    JoinWorkers();
    TransferTest::TearDown();
  }

  MemoryBlobStore store_;
  MemoryQueue queue_;
  JobChannel job_channel_;
  StatusChannel status_channel_;
  Coordinator coordinator_;
  std::vector<std::unique_ptr<WorkerEngine>> engines_;
  std::vector<std::thread> threads_;
};
}  // namespace

TEST(Coordinator, Validate) {
  base::Config::set_max_committable_units(50000);

  EXPECT_NO_THROW(Coordinator::Validate(MakeUpload(20, 2)));
  EXPECT_NO_THROW(Coordinator::Validate(MakeUpload(50000, 1)));

  EXPECT_THROW(Coordinator::Validate(MakeUpload(1, 2)), InvalidPartition);
  EXPECT_THROW(Coordinator::Validate(MakeUpload(50001, 1)), InvalidPartition);
  EXPECT_THROW(Coordinator::Validate(MakeUpload(10, 0)), InvalidPartition);

  auto zero_size = MakeUpload(10, 1);
  zero_size.unit_size = 0;
  EXPECT_THROW(Coordinator::Validate(zero_size), InvalidPartition);
}

TEST(Coordinator, PlanUpload) {
  auto ops = Coordinator::PlanUpload(MakeUpload(103, 10), Ids(10));

  ASSERT_EQ(10u, ops.size());

  const PutRange &first = boost::get<PutRange>(ops[0]);
  const PutRange &fourth = boost::get<PutRange>(ops[3]);

  EXPECT_EQ("id-0", first.id);
  EXPECT_EQ(BLOB, first.blob_name);
  EXPECT_EQ(CONTAINER, first.container_name);
  EXPECT_EQ(0u, first.starting_unit_index);
  EXPECT_EQ(11u, first.unit_count);
  EXPECT_EQ(64u, first.unit_size_bytes);
  EXPECT_EQ(33u, fourth.starting_unit_index);
  EXPECT_EQ(10u, fourth.unit_count);

  EXPECT_THROW(Coordinator::PlanUpload(MakeUpload(103, 10), Ids(9)),
               std::logic_error);
}

TEST(Coordinator, PlanDownload) {
  auto ops = Coordinator::PlanDownload(MakeDownload(1000, 3), 10007, Ids(3));

  ASSERT_EQ(3u, ops.size());

  const GetRange &last = boost::get<GetRange>(ops[2]);

  EXPECT_EQ(4000u, boost::get<GetRange>(ops[0]).total_bytes);
  EXPECT_EQ(7000u, last.start_byte_offset);
  EXPECT_EQ(3007u, last.total_bytes);
  EXPECT_EQ(1000u, last.chunk_size_bytes);
}

TEST(Coordinator, PlanDownloadTooSmall) {
  EXPECT_THROW(Coordinator::PlanDownload(MakeDownload(1000, 2), 1500, Ids(2)),
               InvalidPartition);
  EXPECT_THROW(Coordinator::PlanDownload(MakeDownload(0, 2), 1500, Ids(2)),
               InvalidPartition);
}

TEST_F(CoordinatorTest, UploadEndToEnd) {
  StartWorkers(2);

  auto result = coordinator_.RunUpload(MakeUpload(20, 2));

  ASSERT_EQ(2u, result.reports.size());
  EXPECT_TRUE(result.success());
  EXPECT_EQ(20u * 64, result.bytes);
  EXPECT_GE(result.total_elapsed, 0.0);

  auto commits = store_.commits();
  ASSERT_EQ(1u, commits.size());
  EXPECT_EQ(BlockId::Sequence(20), commits[0]);

  uint64_t size = 0;
  ASSERT_EQ(0, store_.Stat(nullptr, CONTAINER, BLOB, &size));
  EXPECT_EQ(20u * 64, size);

  EXPECT_EQ(0u, queue_.visible(JOB_QUEUE));
  EXPECT_EQ(0u, queue_.visible(STATUS_QUEUE));
}

TEST_F(CoordinatorTest, UploadCleanup) {
  auto request = MakeUpload(4, 1);
  request.cleanup = true;

  StartWorkers(1);
  auto result = coordinator_.RunUpload(request);

  EXPECT_TRUE(result.success());
  EXPECT_EQ(1u, store_.commits().size());
  EXPECT_FALSE(store_.has_blob(CONTAINER, BLOB));
  EXPECT_FALSE(store_.has_container(CONTAINER));
}

TEST_F(CoordinatorTest, InvalidUploadPublishesNothing) {
  EXPECT_THROW(coordinator_.RunUpload(MakeUpload(1, 2)), InvalidPartition);

  EXPECT_EQ(0u, queue_.visible(JOB_QUEUE));
  EXPECT_FALSE(store_.has_container(CONTAINER));
}

TEST_F(CoordinatorTest, FailedWorkerBlocksCommit) {
  base::Config::set_finalize_timeout_in_s(1);
  store_.FailUnit(BlockId::FromIndex(3));

  StartWorkers(2);

  EXPECT_THROW(coordinator_.RunUpload(MakeUpload(10, 2)), FinalizeTimeout);
  EXPECT_TRUE(store_.commits().empty());
}

TEST_F(CoordinatorTest, DownloadEndToEnd) {
  store_.AddBlob(CONTAINER, BLOB, 10007);

  StartWorkers(3);

  auto result = coordinator_.RunDownload(MakeDownload(1000, 3));

  ASSERT_EQ(3u, result.reports.size());
  EXPECT_TRUE(result.success());
  EXPECT_EQ(10007u, result.bytes);

  uint64_t read = 0;
  for (const auto &r : store_.reads()) read += r.second;
  EXPECT_EQ(10007u, read);
}

TEST_F(CoordinatorTest, DownloadMissingObject) {
  EXPECT_THROW(coordinator_.RunDownload(MakeDownload(1000, 1)),
               std::runtime_error);
  EXPECT_EQ(0u, queue_.visible(JOB_QUEUE));
}

TEST_F(CoordinatorTest, PublishFailure) {
  base::Config::set_max_transfer_retries(2);
  queue_.set_put_failures(3);

  EXPECT_THROW(coordinator_.RunUpload(MakeUpload(2, 1)), ChannelUnavailable);
  EXPECT_EQ(0u, queue_.visible(JOB_QUEUE));
}

TEST_F(CoordinatorTest, PublishRetriedMidDispatch) {
  queue_.FailPut(JOB_QUEUE, 2);
  StartWorkers(2);

  auto result = coordinator_.RunUpload(MakeUpload(20, 2));

  ASSERT_EQ(2u, result.reports.size());
  EXPECT_TRUE(result.success());

  auto commits = store_.commits();
  ASSERT_EQ(1u, commits.size());
  EXPECT_EQ(BlockId::Sequence(20), commits[0]);

  EXPECT_EQ(0u, queue_.visible(JOB_QUEUE));
  EXPECT_EQ(0u, queue_.visible(STATUS_QUEUE));
}

}  // namespace tests
}  // namespace transfer
}  // namespace dxfer
