#include "log_densities.h"

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace kombine {

static auto check_dim(const Positions& positions, int dim) -> void {
  if (positions.cols() != dim) {
    throw std::invalid_argument(absl::StrFormat(
        "Expected %d-dimensional positions, got %d-dimensional ones", dim, positions.cols()));
  }
}

Gaussian_log_density::Gaussian_log_density(Eigen::VectorXd mean, double sigma)
    : mean_{std::move(mean)}, sigma_{sigma} {
  if (mean_.size() == 0) {
    throw std::invalid_argument("Gaussian log-density needs at least one dimension");
  }
  if (not (sigma > 0.0) || std::isinf(sigma)) {
    throw std::invalid_argument(absl::StrFormat(
        "Gaussian standard deviation should be positive and finite (not %g)", sigma));
  }
  log_norm_ = -dim() * (0.5 * std::log(2 * std::numbers::pi) + std::log(sigma_));
}

auto Gaussian_log_density::operator()(const Positions& positions) const -> Walker_vector {
  check_dim(positions, dim());

  // log p(x) = -D/2 log(2 pi sigma^2) - |x - mu|^2 / (2 sigma^2)
  auto r2 = Walker_vector((positions.rowwise() - mean_.transpose()).rowwise().squaredNorm());
  return Walker_vector((log_norm_ - r2.array() / (2 * sigma_ * sigma_)).matrix());
}

Uniform_box_log_density::Uniform_box_log_density(int dim, double lo, double hi)
    : dim_{dim}, lo_{lo}, hi_{hi} {
  if (dim < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "Uniform box needs at least one dimension (got %d)", dim));
  }
  if (not (lo < hi) || std::isinf(lo) || std::isinf(hi)) {
    throw std::invalid_argument(absl::StrFormat(
        "Uniform box needs finite bounds with lo < hi (got lo=%g, hi=%g)", lo, hi));
  }
}

auto Uniform_box_log_density::operator()(const Positions& positions) const -> Walker_vector {
  check_dim(positions, dim_);

  auto log_inside = -dim_ * std::log(hi_ - lo_);
  auto result = Walker_vector(positions.rows());
  for (auto k = 0; k != positions.rows(); ++k) {
    auto x = positions.row(k).array();
    result[k] = ((x >= lo_) && (x <= hi_)).all() ? log_inside : -std::numeric_limits<double>::infinity();
  }
  return result;
}

}  // namespace kombine
