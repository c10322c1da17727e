#ifndef KOMBINE_ENSEMBLE_SAMPLER_H_
#define KOMBINE_ENSEMBLE_SAMPLER_H_

#include <cstdint>
#include <memory>
#include <optional>

#include "absl/random/bit_gen_ref.h"
#include "ctpl_stl.h"

#include "ensemble.h"
#include "proposal.h"
#include "sampler_history.h"

namespace kombine {

// An ensemble of walkers advanced by Metropolis-Hastings steps with an independence proposal
// that is refit to the ensemble every `update_interval` steps.
//
// Every step, each walker proposes a jump to a fresh draw x' from the proposal q, and accepts it with
// probability min(1, r), where
//
//          pi(x') q(x)
//     r = -------------,    pi = prior * likelihood.
//          pi(x) q(x')
//
// Because q is not symmetric (it doesn't even depend on x), the q(x) / q(x') factor is essential.
// Each walker remembers log q(x) as computed by the proposal current when x was scored, and that
// value is refreshed for every walker whenever the proposal is rebuilt, so that q(x) and q(x') above
// always come from the same proposal.
//
// The sampler owns its history and its proposal, but not the random bit generator or the thread pool.
class Ensemble_sampler {
 public:
  Ensemble_sampler(
      int num_walkers,
      int dim,
      Log_density_fn log_prior_fn,
      Log_density_fn log_like_fn,
      Proposal_factory proposal_factory,
      absl::BitGenRef bitgen,
      ctpl::thread_pool* thread_pool = nullptr);

  auto num_walkers() const -> int { return num_walkers_; }
  auto dim() const -> int { return dim_; }
  auto iterations() const -> int64_t { return iterations_; }
  auto history() const -> const Sampler_history& { return history_; }

  auto has_proposal() const -> bool { return proposal_ != nullptr; }
  auto proposal() const -> const Proposal&;
  auto num_proposal_builds() const -> int64_t { return num_proposal_builds_; }

  // Fraction of the completed iterations in which each walker accepted its candidate
  // (all zeros before the first iteration)
  auto acceptance_fraction() const -> Walker_vector;

  // Advances the ensemble `iterations` steps starting at `p0`, and returns where the walkers ended up.
  // If the log-prior, log-likelihood or log-proposal-density at `p0` are already known
  // (typically from the result of a previous call), passing them in saves evaluating them again.
  // They are trusted verbatim.
  auto run(
      const Positions& p0,
      int64_t iterations,
      int64_t update_interval = 10,
      const std::optional<Walker_vector>& log_prior0 = std::nullopt,
      const std::optional<Walker_vector>& log_like0 = std::nullopt,
      const std::optional<Walker_vector>& log_q0 = std::nullopt)
      -> Ensemble_state;

 private:
  int num_walkers_;
  int dim_;
  Log_density_fn log_prior_fn_;
  Log_density_fn log_like_fn_;
  Proposal_factory proposal_factory_;
  absl::BitGenRef bitgen_;
  ctpl::thread_pool* thread_pool_;

  int64_t iterations_ = 0;
  std::unique_ptr<Proposal> proposal_;
  int64_t num_proposal_builds_ = 0;
  Sampler_history history_;

  auto build_proposal(const Positions& positions) -> std::unique_ptr<Proposal>;
  auto rebuild_proposal(Ensemble_state& cur) -> void;
  auto do_step(Ensemble_state& cur) -> void;
  auto decide_acceptance(const Walker_vector& log_mh_ratio) -> Accept_mask;

  auto calc_log_prior(const Positions& positions) const -> Walker_vector;
  auto calc_log_like(const Positions& positions) const -> Walker_vector;
  auto calc_log_q(const Proposal& proposal, const Positions& positions) const -> Walker_vector;
};

}  // namespace kombine

#endif // KOMBINE_ENSEMBLE_SAMPLER_H_
