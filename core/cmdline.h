#ifndef KOMBINE_CMDLINE_H_
#define KOMBINE_CMDLINE_H_

#include <memory>
#include <random>

#include "ctpl_stl.h"

#include "ensemble.h"
#include "ensemble_sampler.h"

namespace kombine {

struct Processed_cmd_line {
  std::unique_ptr<ctpl::thread_pool> thread_pool;
  std::unique_ptr<std::mt19937> prng;              // Referenced by `sampler`, so keep it on the heap
  std::unique_ptr<Ensemble_sampler> sampler;
  Positions p0;
  int64_t steps;
  int64_t update_interval;
  int64_t log_every;
};
auto process_args(int argc, char** argv) -> Processed_cmd_line;

}  // namespace kombine

#endif // KOMBINE_CMDLINE_H_
