#include "sampler_history.h"

#include <stdexcept>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"

namespace kombine {

Sampler_history::Sampler_history(int num_walkers, int dim)
    : num_walkers_{num_walkers},
      dim_{dim},
      chain_{},
      log_post_{},
      log_q_{},
      accepted_{} {
  if (num_walkers < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "History needs at least one walker (got %d)", num_walkers));
  }
  if (dim < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "History needs at least one dimension (got %d)", dim));
  }

  log_post_.resize(0, num_walkers_);
  log_q_.resize(0, num_walkers_);
  accepted_.resize(0, num_walkers_);
}

auto Sampler_history::grow(int64_t num_slots) -> void {
  CHECK_GE(num_slots, 0);
  auto old_size = size();
  auto new_size = old_size + num_slots;

  chain_.resize(new_size, Positions::Zero(num_walkers_, dim_));

  log_post_.conservativeResize(new_size, Eigen::NoChange);
  log_post_.bottomRows(num_slots).setZero();

  log_q_.conservativeResize(new_size, Eigen::NoChange);
  log_q_.bottomRows(num_slots).setZero();

  accepted_.conservativeResize(new_size, Eigen::NoChange);
  accepted_.bottomRows(num_slots).setConstant(false);
}

auto Sampler_history::record(int64_t slot, const Ensemble_state& state, const Accept_mask& accepted) -> void {
  CHECK_GE(slot, 0);
  CHECK_LT(slot, size());
  CHECK_EQ(state.positions.rows(), num_walkers_);
  CHECK_EQ(state.positions.cols(), dim_);
  CHECK_EQ(accepted.size(), num_walkers_);

  chain_[slot] = state.positions;
  log_post_.row(slot) = (state.log_prior + state.log_like).transpose();
  log_q_.row(slot) = state.log_q.transpose();
  accepted_.row(slot) = accepted.transpose();
}

auto Sampler_history::positions(int64_t slot) const -> const Positions& {
  CHECK_GE(slot, 0);
  CHECK_LT(slot, size());
  return chain_[slot];
}

}  // namespace kombine
