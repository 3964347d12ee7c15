#include <gtest/gtest.h>

#include "transfer/channel.h"
#include "transfer/status_aggregator.h"
#include "transfer/tests/memory_services.h"

namespace dxfer {
namespace transfer {
namespace tests {

namespace {
const char STATUS_QUEUE[] = "status";

CompletionReport MakeReport(const std::string &id, bool success, double start,
                            double duration) {
  CompletionReport r;

  r.id = id;
  r.node_name = "node-" + id;
  r.success = success;
  r.start_time = start;
  r.duration = duration;
  if (!success) r.detail = "boom";
  return r;
}

class StatusAggregatorTest : public TransferTest {
 protected:
  StatusAggregatorTest() : channel_(&queue_, STATUS_QUEUE) {}

  void Post(const CompletionReport &r) {
    queue_.PutRaw(STATUS_QUEUE, r.Serialize());
  }

  MemoryQueue queue_;
  StatusChannel channel_;
};
}  // namespace

TEST(AggregateResult, ElapsedSpansAllReports) {
  std::vector<CompletionReport> reports;

  // out of order on purpose
  reports.push_back(MakeReport("b", true, 101.0, 4.0));
  reports.push_back(MakeReport("a", true, 100.0, 3.0));

  auto result = StatusAggregator::Summarize(reports, 10 * 1024 * 1024);

  EXPECT_DOUBLE_EQ(5.0, result.total_elapsed);
  EXPECT_DOUBLE_EQ(10.0 * 1024 * 1024 * 8 / 5.0, result.throughput);
  EXPECT_DOUBLE_EQ(16.0, result.throughput_mbps());
  EXPECT_TRUE(result.success());
}

TEST(AggregateResult, ElapsedIndependentOfArrivalOrder) {
  const double t0 = 1700000000.0;
  const auto early = MakeReport("a", true, t0, 5.0);      // ends at t0+5
  const auto late = MakeReport("b", true, t0 + 2.0, 1.0);  // ends at t0+3

  auto forward = StatusAggregator::Summarize({early, late}, 1024);
  auto backward = StatusAggregator::Summarize({late, early}, 1024);

  EXPECT_DOUBLE_EQ(5.0, forward.total_elapsed);
  EXPECT_DOUBLE_EQ(5.0, backward.total_elapsed);
  EXPECT_DOUBLE_EQ(1024.0 * 8 / 5.0, forward.throughput);
  EXPECT_DOUBLE_EQ(forward.throughput, backward.throughput);
}

TEST(AggregateResult, ZeroElapsed) {
  std::vector<CompletionReport> reports;

  reports.push_back(MakeReport("a", true, 100.0, 0.0));

  auto result = StatusAggregator::Summarize(reports, 1024);

  EXPECT_DOUBLE_EQ(0.0, result.total_elapsed);
  EXPECT_DOUBLE_EQ(0.0, result.throughput);
}

TEST(AggregateResult, NoReports) {
  auto result = StatusAggregator::Summarize({}, 1024);

  EXPECT_EQ(0u, result.reports.size());
  EXPECT_DOUBLE_EQ(0.0, result.throughput);
  EXPECT_TRUE(result.success());
}

TEST_F(StatusAggregatorTest, CollectsExpectedReports) {
  Post(MakeReport("b", false, 101.0, 4.0));
  Post(MakeReport("a", true, 100.0, 3.0));

  StatusAggregator aggregator(&channel_);
  auto result = aggregator.Await({"a", "b"}, 1000);

  ASSERT_EQ(2u, result.reports.size());
  EXPECT_EQ("b", result.reports[0].id);
  EXPECT_EQ("a", result.reports[1].id);
  EXPECT_EQ(1u, result.failed());
  EXPECT_FALSE(result.success());
  EXPECT_DOUBLE_EQ(5.0, result.total_elapsed);
  EXPECT_EQ(1000u, result.bytes);

  // everything received was acknowledged
  EXPECT_EQ(0u, queue_.visible(STATUS_QUEUE));
  EXPECT_EQ(0u, queue_.in_flight(STATUS_QUEUE));
}

TEST_F(StatusAggregatorTest, ElapsedSameWhicheverReportArrivesFirst) {
  const double t0 = 1700000000.0;

  for (int order = 0; order < 2; order++) {
    const auto early = MakeReport("a", true, t0, 5.0);
    const auto late = MakeReport("b", true, t0 + 2.0, 1.0);

    Post(order ? late : early);
    Post(order ? early : late);

    StatusAggregator aggregator(&channel_);
    auto result = aggregator.Await({"a", "b"}, 1024);

    ASSERT_EQ(2u, result.reports.size());
    EXPECT_EQ(order ? "b" : "a", result.reports[0].id);
    EXPECT_DOUBLE_EQ(5.0, result.total_elapsed) << "order " << order;
  }
}

TEST_F(StatusAggregatorTest, DropsStraysAndDuplicates) {
  Post(MakeReport("old-run", true, 1.0, 1.0));
  Post(MakeReport("a", true, 100.0, 1.0));
  Post(MakeReport("a", true, 100.0, 1.0));
  Post(MakeReport("b", true, 100.0, 2.0));

  StatusAggregator aggregator(&channel_);
  auto result = aggregator.Await({"a", "b"}, 0);

  ASSERT_EQ(2u, result.reports.size());
  EXPECT_EQ(2u, aggregator.strays());
  EXPECT_EQ(0u, aggregator.malformed());

  // the stray from an earlier run mustn't stretch the elapsed time
  EXPECT_DOUBLE_EQ(2.0, result.total_elapsed);
}

TEST_F(StatusAggregatorTest, DropsMalformed) {
  queue_.PutRaw(STATUS_QUEUE, "garbage");
  queue_.PutRaw(STATUS_QUEUE, "{\"id\": \"a\"}");
  Post(MakeReport("a", true, 100.0, 1.0));

  StatusAggregator aggregator(&channel_);
  auto result = aggregator.Await({"a"}, 0);

  ASSERT_EQ(1u, result.reports.size());
  EXPECT_EQ(2u, aggregator.malformed());
  EXPECT_EQ(0u, queue_.visible(STATUS_QUEUE));
}

TEST_F(StatusAggregatorTest, StopsAtLastOutstanding) {
  Post(MakeReport("a", true, 100.0, 1.0));
  Post(MakeReport("later", true, 100.0, 1.0));

  StatusAggregator aggregator(&channel_);
  aggregator.Await({"a"}, 0);

  EXPECT_EQ(1u, queue_.visible(STATUS_QUEUE));
}

}  // namespace tests
}  // namespace transfer
}  // namespace dxfer
