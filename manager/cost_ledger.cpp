#include "manager/cost_ledger.hpp"

#include "glog/logging.h"

namespace manager {

CostLedger::CostLedger() : current_(std::make_shared<proto::CostLedger>()) {}

double CostLedger::Record(const std::string& step, int64_t tokens_in,
                          int64_t tokens_out, const UnitCost& unit_cost) {
  CHECK_GE(tokens_in, 0);
  CHECK_GE(tokens_out, 0);
  std::shared_ptr<const proto::CostLedger> previous;
  {
    absl::MutexLock lock(&mutex_);
    previous = current_;
  }
  double cost = (tokens_in * unit_cost.input_per_mtok +
                 tokens_out * unit_cost.output_per_mtok) /
                1e6;
  auto next = std::make_shared<proto::CostLedger>(*previous);
  proto::CostEntry* entry = next->add_entries();
  entry->set_step(step);
  entry->set_tokens_in(tokens_in);
  entry->set_tokens_out(tokens_out);
  entry->set_cost(cost);
  next->set_total_tokens(previous->total_tokens() + tokens_in + tokens_out);
  next->set_total_cost(previous->total_cost() + cost);
  VLOG(1) << "Cost of " << step << ": " << tokens_in << "+" << tokens_out
          << " tokens, $" << cost;
  {
    absl::MutexLock lock(&mutex_);
    current_ = std::move(next);
  }
  return cost;
}

proto::CostLedger CostLedger::Snapshot() const {
  std::shared_ptr<const proto::CostLedger> current;
  {
    absl::MutexLock lock(&mutex_);
    current = current_;
  }
  return *current;
}

}  // namespace manager
