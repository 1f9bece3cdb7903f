#ifndef MANAGER_COST_LEDGER_HPP
#define MANAGER_COST_LEDGER_HPP

#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/ledger.pb.h"

namespace manager {

// Price of the tokens of one call, in USD per million tokens.
struct UnitCost {
  double input_per_mtok = 0;
  double output_per_mtok = 0;
};

// Append-only record of the tokens spent by a run. Record is meant to be
// called by a single writer; Snapshot can be called from any thread at any
// time and returns a consistent copy.
class CostLedger {
 public:
  CostLedger();

  // Appends an entry and returns its cost.
  double Record(const std::string& step, int64_t tokens_in, int64_t tokens_out,
                const UnitCost& unit_cost);

  proto::CostLedger Snapshot() const;

 private:
  mutable absl::Mutex mutex_;
  // Published snapshots are never modified.
  std::shared_ptr<const proto::CostLedger> current_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace manager

#endif
