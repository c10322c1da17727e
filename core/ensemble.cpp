#include "ensemble.h"

#include <stdexcept>

#include "absl/strings/str_format.h"

namespace kombine {

auto check_positions_shape(const Positions& positions, int num_walkers, int dim, std::string_view what) -> void {
  if (positions.rows() != num_walkers || positions.cols() != dim) {
    throw std::invalid_argument(absl::StrFormat(
        "%s should have shape (%d, %d), but has shape (%d, %d)",
        what, num_walkers, dim, positions.rows(), positions.cols()));
  }
}

auto check_walker_vector_size(const Walker_vector& values, int num_walkers, std::string_view what) -> void {
  if (values.size() != num_walkers) {
    throw std::invalid_argument(absl::StrFormat(
        "%s should have one entry per walker (%d), but has %d",
        what, num_walkers, values.size()));
  }
}

}  // namespace kombine
