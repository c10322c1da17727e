#ifndef KOMBINE_LOG_DENSITIES_H_
#define KOMBINE_LOG_DENSITIES_H_

#include <ostream>

#include <absl/strings/str_format.h>

#include "ensemble.h"

namespace kombine {

// Batched log-densities over (N, D) positions, usable wherever a Log_density_fn is expected.
// No setters: change by assigning a new one (validation is consolidated in the constructors)

// Isotropic normal with mean `mean` and standard deviation `sigma` along every axis
class Gaussian_log_density {
 public:
  Gaussian_log_density(Eigen::VectorXd mean, double sigma);

  auto dim() const -> int { return static_cast<int>(mean_.size()); }
  auto mean() const -> const Eigen::VectorXd& { return mean_; }
  auto sigma() const -> double { return sigma_; }

  auto operator()(const Positions& positions) const -> Walker_vector;

  friend auto operator<<(std::ostream& os, const Gaussian_log_density& d) -> std::ostream& {
    return os << absl::StreamFormat("Gaussian_log_density{dim=%d, sigma=%g}", d.dim(), d.sigma());
  }

 private:
  Eigen::VectorXd mean_;
  double sigma_;
  double log_norm_;
};

// Uniform over the box [lo, hi]^D (bounds included)
class Uniform_box_log_density {
 public:
  Uniform_box_log_density(int dim, double lo, double hi);

  auto dim() const -> int { return dim_; }
  auto lo() const -> double { return lo_; }
  auto hi() const -> double { return hi_; }

  auto operator()(const Positions& positions) const -> Walker_vector;

  friend auto operator<<(std::ostream& os, const Uniform_box_log_density& d) -> std::ostream& {
    return os << absl::StreamFormat("Uniform_box_log_density{dim=%d, lo=%g, hi=%g}", d.dim(), d.lo(), d.hi());
  }

 private:
  int dim_;
  double lo_;
  double hi_;
};

}  // namespace kombine

#endif // KOMBINE_LOG_DENSITIES_H_
