#ifndef KOMBINE_ENSEMBLE_H_
#define KOMBINE_ENSEMBLE_H_

#include <functional>
#include <string_view>

#include <Eigen/Dense>

namespace kombine {

// One row per walker, one column per dimension
using Positions = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One entry per walker
using Walker_vector = Eigen::VectorXd;
using Accept_mask = Eigen::Array<bool, Eigen::Dynamic, 1>;

// One row per iteration, one column per walker
using Walker_matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Accept_matrix = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// A batched log-density: (N, D) positions in, N natural-log densities out
using Log_density_fn = std::function<Walker_vector(const Positions&)>;

// Where every walker is, in parameter space and in probability space.
// The four members always describe the same walkers: when a walker moves, all four change together.
struct Ensemble_state {
  Positions positions;
  Walker_vector log_prior;
  Walker_vector log_like;
  Walker_vector log_q;   // log-density of the proposal that was current when the walker was last scored

  auto log_post() const -> Walker_vector { return log_prior + log_like; }
};

// Throws std::invalid_argument unless `positions` is num_walkers x dim
auto check_positions_shape(const Positions& positions, int num_walkers, int dim, std::string_view what) -> void;

// Throws std::invalid_argument unless `values` has exactly num_walkers entries
auto check_walker_vector_size(const Walker_vector& values, int num_walkers, std::string_view what) -> void;

}  // namespace kombine

#endif // KOMBINE_ENSEMBLE_H_
