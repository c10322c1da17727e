#ifndef KOMBINE_SAMPLER_HISTORY_H_
#define KOMBINE_SAMPLER_HISTORY_H_

#include <cstdint>
#include <vector>

#include "ensemble.h"

namespace kombine {

// Full-ensemble snapshots, one slot per iteration.
//
// Slots are allocated in batches with `grow` and then filled in order with `record`.  All four
// sequences (positions, log-posterior, log-proposal-density, acceptance) always have `size()` slots.
// Slots that were grown but never recorded (e.g., because an evaluator threw in the middle of a run)
// stay zero-filled; the sampler's iteration counter says how many slots hold real data.
class Sampler_history {
 public:
  Sampler_history(int num_walkers, int dim);

  auto num_walkers() const -> int { return num_walkers_; }
  auto dim() const -> int { return dim_; }
  auto size() const -> int64_t { return std::ssize(chain_); }
  auto empty() const -> bool { return chain_.empty(); }

  auto grow(int64_t num_slots) -> void;
  auto record(int64_t slot, const Ensemble_state& state, const Accept_mask& accepted) -> void;

  auto chain() const -> const std::vector<Positions>& { return chain_; }
  auto positions(int64_t slot) const -> const Positions&;
  auto log_post() const -> const Walker_matrix& { return log_post_; }
  auto log_q() const -> const Walker_matrix& { return log_q_; }
  auto accepted() const -> const Accept_matrix& { return accepted_; }

 private:
  int num_walkers_;
  int dim_;

  std::vector<Positions> chain_;
  Walker_matrix log_post_;
  Walker_matrix log_q_;
  Accept_matrix accepted_;
};

}  // namespace kombine

#endif // KOMBINE_SAMPLER_HISTORY_H_
