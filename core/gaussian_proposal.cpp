#include "gaussian_proposal.h"

#include <cmath>
#include <numbers>
#include <stdexcept>

#include "absl/log/check.h"
#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"

#include "chunked_sum.h"

namespace kombine {

Gaussian_proposal::Gaussian_proposal(const Positions& ensemble, ctpl::thread_pool* thread_pool, double scale)
    : scale_{scale} {

  if (not (scale > 0.0) || std::isinf(scale)) {
    throw std::invalid_argument(absl::StrFormat(
        "Gaussian proposal covariance scale should be positive and finite (not %g)", scale));
  }
  auto N = static_cast<int>(ensemble.rows());
  auto D = static_cast<int>(ensemble.cols());
  if (N < 2) {
    throw std::invalid_argument(absl::StrFormat(
        "Fitting a Gaussian proposal needs at least 2 walkers (got %d)", N));
  }
  if (D < 1) {
    throw std::invalid_argument("Fitting a Gaussian proposal needs at least 1 dimension");
  }

  // Mean
  auto sum_x = sum_over_chunks<Eigen::VectorXd>(thread_pool, N, [&ensemble](int begin, int end) {
    return Eigen::VectorXd(ensemble.middleRows(begin, end - begin).colwise().sum().transpose());
  });
  mean_ = sum_x / N;

  // Covariance (two-pass, to avoid cancellation when the ensemble is far from the origin)
  auto sum_dx_dxT = sum_over_chunks<Eigen::MatrixXd>(thread_pool, N, [&ensemble, this](int begin, int end) {
    auto dx = Eigen::MatrixXd(ensemble.middleRows(begin, end - begin).rowwise() - mean_.transpose());
    return Eigen::MatrixXd(dx.transpose() * dx);
  });
  auto cov = Eigen::MatrixXd((scale_ / (N - 1)) * sum_dx_dxT);

  llt_.compute(cov);
  auto diag_L = Eigen::VectorXd(llt_.matrixL().toDenseMatrix().diagonal());
  if (llt_.info() != Eigen::Success || not (diag_L.array() > 0.0).all() || not diag_L.allFinite()) {
    throw std::invalid_argument(absl::StrFormat(
        "Ensemble covariance is not positive definite (%d walkers in %d dimensions); "
        "are the walkers all on a lower-dimensional subspace?", N, D));
  }

  log_norm_ = -0.5 * D * std::log(2 * std::numbers::pi) - diag_L.array().log().sum();
}

auto Gaussian_proposal::factory(double scale) -> Proposal_factory {
  return [scale](const Positions& ensemble, ctpl::thread_pool* thread_pool) -> std::unique_ptr<Proposal> {
    return std::make_unique<Gaussian_proposal>(ensemble, thread_pool, scale);
  };
}

auto Gaussian_proposal::log_density(const Positions& positions) const -> Walker_vector {
  if (positions.cols() != dim()) {
    throw std::invalid_argument(absl::StrFormat(
        "Gaussian proposal is %d-dimensional, but positions are %d-dimensional", dim(), positions.cols()));
  }

  // Column k of z is L^{-1} (x_k - m)
  auto dx = Eigen::MatrixXd((positions.rowwise() - mean_.transpose()).transpose());
  auto z = Eigen::MatrixXd(llt_.matrixL().solve(dx));

  return Walker_vector((log_norm_ - 0.5 * z.colwise().squaredNorm().array()).transpose().matrix());
}

auto Gaussian_proposal::draw(int count, absl::BitGenRef bitgen) const -> Positions {
  CHECK_GE(count, 0);

  // x = m + L z, with z ~ N(0, 1) one walker at a time
  auto z = Eigen::MatrixXd(dim(), count);
  for (auto k = 0; k != count; ++k) {
    for (auto i = 0; i != dim(); ++i) {
      z(i, k) = absl::Gaussian<double>(bitgen, 0.0, 1.0);
    }
  }

  auto result = Positions((llt_.matrixL() * z).transpose());
  result.rowwise() += mean_.transpose();
  return result;
}

}  // namespace kombine
