#include "ensemble_sampler.h"

#include <cmath>
#include <stdexcept>

#include "absl/log/check.h"
#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"

namespace kombine {

Ensemble_sampler::Ensemble_sampler(
    int num_walkers,
    int dim,
    Log_density_fn log_prior_fn,
    Log_density_fn log_like_fn,
    Proposal_factory proposal_factory,
    absl::BitGenRef bitgen,
    ctpl::thread_pool* thread_pool)
    : num_walkers_{num_walkers},
      dim_{dim},
      log_prior_fn_{std::move(log_prior_fn)},
      log_like_fn_{std::move(log_like_fn)},
      proposal_factory_{std::move(proposal_factory)},
      bitgen_{bitgen},
      thread_pool_{thread_pool},
      proposal_{},
      history_{num_walkers, dim} {

  // (num_walkers and dim are also validated by history_ above, but with less helpful messages)
  if (not log_prior_fn_) {
    throw std::invalid_argument("Ensemble sampler needs a log-prior function");
  }
  if (not log_like_fn_) {
    throw std::invalid_argument("Ensemble sampler needs a log-likelihood function");
  }
  if (not proposal_factory_) {
    throw std::invalid_argument("Ensemble sampler needs a proposal factory");
  }
}

auto Ensemble_sampler::proposal() const -> const Proposal& {
  CHECK(has_proposal()) << "No proposal has been built yet (call run() first)";
  return *proposal_;
}

auto Ensemble_sampler::acceptance_fraction() const -> Walker_vector {
  if (iterations_ == 0) {
    return Walker_vector::Zero(num_walkers_);
  }
  return Walker_vector(
      history_.accepted().topRows(iterations_).cast<double>().colwise().mean().transpose().matrix());
}

auto Ensemble_sampler::run(
    const Positions& p0,
    int64_t iterations,
    int64_t update_interval,
    const std::optional<Walker_vector>& log_prior0,
    const std::optional<Walker_vector>& log_like0,
    const std::optional<Walker_vector>& log_q0)
    -> Ensemble_state {

  // Validate everything before touching any state
  check_positions_shape(p0, num_walkers_, dim_, "Initial positions");
  if (iterations < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "Number of iterations should be at least 1 (got %d)", iterations));
  }
  if (update_interval < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "Proposal update interval should be at least 1 (got %d)", update_interval));
  }
  if (log_prior0.has_value()) { check_walker_vector_size(log_prior0.value(), num_walkers_, "Initial log-priors"); }
  if (log_like0.has_value()) { check_walker_vector_size(log_like0.value(), num_walkers_, "Initial log-likelihoods"); }
  if (log_q0.has_value()) { check_walker_vector_size(log_q0.value(), num_walkers_, "Initial log-proposal-densities"); }

  if (not has_proposal()) {
    proposal_ = build_proposal(p0);
  }

  auto cur = Ensemble_state{};
  cur.positions = p0;
  cur.log_prior = log_prior0.has_value() ? log_prior0.value() : calc_log_prior(p0);
  cur.log_like = log_like0.has_value() ? log_like0.value() : calc_log_like(p0);
  cur.log_q = log_q0.has_value() ? log_q0.value() : calc_log_q(*proposal_, p0);

  // Allocate this call's history up front, then fill it in slot by slot.
  // (If an earlier run failed part way through, its unfilled slots get overwritten first)
  history_.grow(iterations);
  CHECK_LE(iterations_ + iterations, history_.size());

  for (auto i = int64_t{0}; i != iterations; ++i) {
    do_step(cur);

    if (iterations_ % update_interval == 0) {
      rebuild_proposal(cur);
    }
  }

  return cur;
}

auto Ensemble_sampler::do_step(Ensemble_state& cur) -> void {
  // Independence proposal: candidates don't depend on where the walkers currently are
  auto cand = Ensemble_state{};
  cand.positions = proposal_->draw(num_walkers_, bitgen_);
  if (cand.positions.rows() != num_walkers_ || cand.positions.cols() != dim_) {
    throw std::runtime_error(absl::StrFormat(
        "Proposal drew a (%d, %d) batch of candidates, expected (%d, %d)",
        cand.positions.rows(), cand.positions.cols(), num_walkers_, dim_));
  }
  cand.log_prior = calc_log_prior(cand.positions);
  cand.log_like = calc_log_like(cand.positions);
  cand.log_q = calc_log_q(*proposal_, cand.positions);

  //   log r = log pi(x') - log pi(x) + log q(x) - log q(x')
  auto log_mh_ratio = Walker_vector(
      (cand.log_prior + cand.log_like) - (cur.log_prior + cur.log_like) + cur.log_q - cand.log_q);

  auto accepted = decide_acceptance(log_mh_ratio);

  // Accepted walkers move to their candidates; rejected walkers keep *everything*,
  // including the log q(x) computed by the proposal that was current when x was scored
  cur.positions = accepted.replicate(1, dim_).select(cand.positions, cur.positions);
  cur.log_prior = accepted.select(cand.log_prior, cur.log_prior);
  cur.log_like = accepted.select(cand.log_like, cur.log_like);
  cur.log_q = accepted.select(cand.log_q, cur.log_q);

  history_.record(iterations_, cur, accepted);
  ++iterations_;
}

auto Ensemble_sampler::decide_acceptance(const Walker_vector& log_mh_ratio) -> Accept_mask {
  // A NaN ratio fails both comparisons below, so that walker is rejected
  auto accepted = Accept_mask(log_mh_ratio.array() > 0.0);

  // One uniform per remaining walker, drawn in walker order
  for (auto i = 0; i != num_walkers_; ++i) {
    if (not accepted[i]) {
      auto u = absl::Uniform(absl::IntervalClosedOpen, bitgen_, 0.0, 1.0);
      accepted[i] = log_mh_ratio[i] > std::log(u);
    }
  }

  return accepted;
}

auto Ensemble_sampler::rebuild_proposal(Ensemble_state& cur) -> void {
  // Score the current positions under the new proposal before installing it, so that a failure
  // leaves the old proposal and the old log q's in place
  auto new_proposal = build_proposal(cur.positions);
  auto new_log_q = calc_log_q(*new_proposal, cur.positions);

  proposal_ = std::move(new_proposal);
  cur.log_q = std::move(new_log_q);
}

auto Ensemble_sampler::build_proposal(const Positions& positions) -> std::unique_ptr<Proposal> {
  auto proposal = proposal_factory_(positions, thread_pool_);
  if (proposal == nullptr) {
    throw std::runtime_error("Proposal factory did not build a proposal");
  }
  ++num_proposal_builds_;
  return proposal;
}

auto Ensemble_sampler::calc_log_prior(const Positions& positions) const -> Walker_vector {
  auto result = log_prior_fn_(positions);
  if (result.size() != positions.rows()) {
    throw std::runtime_error(absl::StrFormat(
        "Log-prior function returned %d values for %d walkers", result.size(), positions.rows()));
  }
  return result;
}

auto Ensemble_sampler::calc_log_like(const Positions& positions) const -> Walker_vector {
  auto result = log_like_fn_(positions);
  if (result.size() != positions.rows()) {
    throw std::runtime_error(absl::StrFormat(
        "Log-likelihood function returned %d values for %d walkers", result.size(), positions.rows()));
  }
  return result;
}

auto Ensemble_sampler::calc_log_q(const Proposal& proposal, const Positions& positions) const -> Walker_vector {
  auto result = proposal.log_density(positions);
  if (result.size() != positions.rows()) {
    throw std::runtime_error(absl::StrFormat(
        "Proposal returned %d log-densities for %d walkers", result.size(), positions.rows()));
  }
  return result;
}

}  // namespace kombine
