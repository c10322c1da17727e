#ifndef KOMBINE_PROPOSAL_H_
#define KOMBINE_PROPOSAL_H_

#include <functional>
#include <memory>

#include "absl/random/bit_gen_ref.h"
#include "ctpl_stl.h"

#include "ensemble.h"

namespace kombine {

// An independence proposal fitted to a snapshot of the ensemble.
// A proposal is never refit: when the ensemble moves on, the sampler builds a new one.
class Proposal {
 public:
  virtual ~Proposal() = default;

  // Natural-log proposal density at each row of `positions`
  virtual auto log_density(const Positions& positions) const -> Walker_vector = 0;

  // `count` i.i.d. draws from the proposal, one per row
  virtual auto draw(int count, absl::BitGenRef bitgen) const -> Positions = 0;
};

// Builds a proposal from the current ensemble positions.  `thread_pool` may be null; if not,
// the proposal may use it to parallelize its fit, and must be done with it by the time it returns.
using Proposal_factory = std::function<std::unique_ptr<Proposal>(
    const Positions& ensemble, ctpl::thread_pool* thread_pool)>;

}  // namespace kombine

#endif // KOMBINE_PROPOSAL_H_
