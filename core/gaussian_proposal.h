#ifndef KOMBINE_GAUSSIAN_PROPOSAL_H_
#define KOMBINE_GAUSSIAN_PROPOSAL_H_

#include <Eigen/Dense>

#include "proposal.h"

namespace kombine {

// A single multivariate normal fitted to the ensemble:
//
//   q(x) = (2 pi)^{-D/2} |S|^{-1/2} exp[-(x - m)^T S^{-1} (x - m) / 2],
//
// where m is the ensemble mean and S is `scale` times the ensemble covariance (normalized by N-1).
// We keep the Cholesky factor S = L L^T and work with z = L^{-1} (x - m) throughout, so
//
//   log q(x) = -D/2 log(2 pi) - sum_i log L_ii - |z|^2 / 2.
//
// This is the simplest proposal that adapts to the ensemble; a good proposal for multimodal targets
// would instead fit a mixture (e.g., a clustered kernel density estimate).
class Gaussian_proposal : public Proposal {
 public:
  // Requires at least 2 walkers, and enough of them in general position for the covariance to be
  // positive definite (in particular, more walkers than dimensions).
  // If `thread_pool` is not null, the sums over walkers in the fit are split across its threads.
  Gaussian_proposal(const Positions& ensemble, ctpl::thread_pool* thread_pool, double scale = 1.0);

  // Proposal_factory that builds a Gaussian_proposal with the given covariance scale
  static auto factory(double scale = 1.0) -> Proposal_factory;

  auto dim() const -> int { return static_cast<int>(mean_.size()); }
  auto scale() const -> double { return scale_; }
  auto mean() const -> const Eigen::VectorXd& { return mean_; }
  auto covariance() const -> Eigen::MatrixXd { return llt_.reconstructedMatrix(); }

  auto log_density(const Positions& positions) const -> Walker_vector override;
  auto draw(int count, absl::BitGenRef bitgen) const -> Positions override;

 private:
  double scale_;
  Eigen::VectorXd mean_;
  Eigen::LLT<Eigen::MatrixXd> llt_;
  double log_norm_;
};

}  // namespace kombine

#endif // KOMBINE_GAUSSIAN_PROPOSAL_H_
