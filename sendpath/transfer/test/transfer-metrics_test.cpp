#include "sendpath/transfer-metrics.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <thread>
#include <vector>

#include "sendpath/transfer-error.hpp"
#include "sendpath/transfer-result.hpp"
#include "sendpath/transfer-state.hpp"
#include "sendpath/transfer-stats.hpp"

namespace sendpath {

TEST(TransferMetricsTest, EmptySnapshot) {
  TransferMetrics metrics;
  const auto stats = metrics.snapshot();
  EXPECT_EQ(stats.totalTransfers, 0U);
  EXPECT_EQ(stats.totalBytesTransferred, 0U);
  EXPECT_EQ(stats.zeroCopyPercentage(), 0.0);
}

TEST(TransferMetricsTest, SingleZeroCopyTransferIsHundredPercent) {
  TransferMetrics metrics;
  metrics.recordTransfer(4096, true);
  const auto stats = metrics.snapshot();
  EXPECT_EQ(stats.totalTransfers, 1U);
  EXPECT_EQ(stats.zeroCopyTransfers, 1U);
  EXPECT_EQ(stats.fallbackTransfers, 0U);
  EXPECT_EQ(stats.totalBytesTransferred, 4096U);
  EXPECT_DOUBLE_EQ(stats.zeroCopyPercentage(), 100.0);
}

TEST(TransferMetricsTest, MixedTransfers) {
  TransferMetrics metrics;
  metrics.recordTransfer(10, true);
  metrics.recordTransfer(20, false);
  metrics.recordTransfer(30, false);
  metrics.recordTransfer(40, true);
  const auto stats = metrics.snapshot();
  EXPECT_EQ(stats.totalTransfers, 4U);
  EXPECT_EQ(stats.zeroCopyTransfers, 2U);
  EXPECT_EQ(stats.fallbackTransfers, 2U);
  EXPECT_EQ(stats.totalBytesTransferred, 100U);
  EXPECT_DOUBLE_EQ(stats.zeroCopyPercentage(), 50.0);
}

TEST(TransferMetricsTest, OutcomeCountsFailures) {
  TransferMetrics metrics;
  metrics.recordOutcome(TransferResult{.bytesTransferred = 5, .completed = true, .state = TransferState::Completed});
  metrics.recordOutcome(TransferResult{.bytesTransferred = 3,
                                       .usedZeroCopy = true,
                                       .error = TransferError::StalledTransfer,
                                       .state = TransferState::Stalled});
  metrics.recordOutcome(TransferResult{.error = TransferError::UnsupportedRequest, .state = TransferState::Failed});
  const auto stats = metrics.snapshot();
  EXPECT_EQ(stats.totalTransfers, 3U);
  EXPECT_EQ(stats.totalBytesTransferred, 8U);
  EXPECT_EQ(stats.zeroCopyTransfers, 1U);
  EXPECT_EQ(stats.failedTransfers, 2U);
  EXPECT_EQ(stats.stalledTransfers, 1U);
}

TEST(TransferMetricsTest, ConcurrentRecordsAreNotLost) {
  static constexpr int kThreads = 8;
  static constexpr int kPerThread = 10000;
  TransferMetrics metrics;
  {
    std::vector<std::jthread> threads;
    for (int tid = 0; tid < kThreads; ++tid) {
      threads.emplace_back([&metrics, tid] {
        for (int i = 0; i < kPerThread; ++i) {
          metrics.recordTransfer(3, tid % 2 == 0);
        }
      });
    }
    // Concurrent reader: counters never go backwards and zero-copy never exceeds total.
    uint64_t lastTotal = 0;
    for (int i = 0; i < 1000; ++i) {
      const auto stats = metrics.snapshot();
      EXPECT_GE(stats.totalTransfers, lastTotal);
      EXPECT_LE(stats.zeroCopyTransfers, stats.totalTransfers);
      lastTotal = stats.totalTransfers;
    }
  }
  const auto stats = metrics.snapshot();
  EXPECT_EQ(stats.totalTransfers, uint64_t{kThreads} * kPerThread);
  EXPECT_EQ(stats.zeroCopyTransfers, uint64_t{kThreads / 2} * kPerThread);
  EXPECT_EQ(stats.totalBytesTransferred, uint64_t{3} * kThreads * kPerThread);
  EXPECT_DOUBLE_EQ(stats.zeroCopyPercentage(), 50.0);
}

TEST(TransferMetricsTest, GlobalIsSingleInstance) { EXPECT_EQ(&TransferMetrics::Global(), &TransferMetrics::Global()); }

TEST(TransferStatsTest, JsonContainsEveryField) {
  TransferStats stats;
  stats.totalBytesTransferred = 1024;
  stats.totalTransfers = 4;
  stats.zeroCopyTransfers = 1;
  stats.fallbackTransfers = 3;
  stats.failedTransfers = 2;
  stats.stalledTransfers = 1;
  EXPECT_EQ(stats.json_str(),
            R"({"totalBytesTransferred":1024,"totalTransfers":4,"zeroCopyTransfers":1,"fallbackTransfers":3,)"
            R"("failedTransfers":2,"stalledTransfers":1,"zeroCopyPercentage":25})");
}

TEST(TransferStatsTest, ForEachFieldVisitsInOrder) {
  TransferStats stats;
  std::vector<std::string_view> names;
  stats.for_each_field([&names](std::string_view name, auto) { names.push_back(name); });
  ASSERT_EQ(names.size(), 7U);
  EXPECT_EQ(names.front(), "totalBytesTransferred");
  EXPECT_EQ(names.back(), "zeroCopyPercentage");
}

}  // namespace sendpath
