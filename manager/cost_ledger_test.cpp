#include "manager/cost_ledger.hpp"

#include <atomic>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(CostLedgerTest, TotalsAreSums) {
  manager::CostLedger ledger;
  manager::UnitCost price{3.0, 15.0};
  EXPECT_DOUBLE_EQ(ledger.Record("planning", 1000, 200, price), 0.006);
  ledger.Record("code_generation_iter_1", 2000, 1000, price);
  ledger.Record("error_fixing_iter_1", 0, 0, price);

  proto::CostLedger snapshot = ledger.Snapshot();
  ASSERT_EQ(snapshot.entries_size(), 3);
  EXPECT_EQ(snapshot.entries(0).step(), "planning");
  EXPECT_EQ(snapshot.entries(1).step(), "code_generation_iter_1");
  EXPECT_EQ(snapshot.entries(2).cost(), 0);
  EXPECT_EQ(snapshot.total_tokens(), 4200);
  double sum = 0;
  for (const proto::CostEntry& entry : snapshot.entries()) sum += entry.cost();
  EXPECT_DOUBLE_EQ(snapshot.total_cost(), sum);
  EXPECT_DOUBLE_EQ(snapshot.total_cost(), 0.006 + 0.021);
}

// NOLINTNEXTLINE
TEST(CostLedgerTest, SnapshotsAreIndependent) {
  manager::CostLedger ledger;
  ledger.Record("planning", 10, 10, {});
  proto::CostLedger before = ledger.Snapshot();
  ledger.Record("test_inference", 10, 10, {});
  EXPECT_EQ(before.entries_size(), 1);
  EXPECT_EQ(before.total_tokens(), 20);
  EXPECT_EQ(ledger.Snapshot().entries_size(), 2);
  EXPECT_EQ(ledger.Snapshot().total_tokens(), 40);
}

// NOLINTNEXTLINE
TEST(CostLedgerTest, ConcurrentSnapshotsAreConsistent) {
  manager::CostLedger ledger;
  std::atomic<bool> done{false};
  std::atomic<int> inconsistent{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; i++) {
    readers.emplace_back([&]() {
      int64_t last_size = 0;
      while (!done) {
        proto::CostLedger snapshot = ledger.Snapshot();
        int64_t tokens = 0;
        for (const proto::CostEntry& entry : snapshot.entries()) {
          tokens += entry.tokens_in() + entry.tokens_out();
        }
        if (tokens != snapshot.total_tokens()) inconsistent++;
        if (snapshot.entries_size() < last_size) inconsistent++;
        last_size = snapshot.entries_size();
      }
    });
  }
  for (int i = 0; i < 1000; i++) {
    ledger.Record("step", i, 1, manager::UnitCost{1, 1});
  }
  done = true;
  for (std::thread& reader : readers) reader.join();
  EXPECT_EQ(inconsistent, 0);
  EXPECT_EQ(ledger.Snapshot().entries_size(), 1000);
}

}  // namespace
