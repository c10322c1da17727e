#include <algorithm>
#include <chrono>
#include <cmath>
#include <deque>
#include <iostream>

#include <absl/log/initialize.h>
#include <absl/strings/str_format.h>

#include "cmdline.h"
#include "ensemble_sampler.h"

namespace kombine {

struct Timestamp {
  int64_t step;
  std::chrono::time_point<std::chrono::high_resolution_clock> time;
};
static std::deque<Timestamp> timestamps;
inline constexpr size_t k_max_timestamps = 10;

static auto print_stats_line(const Ensemble_sampler& sampler, const Ensemble_state& state, int64_t since_step) -> void {
  auto steps_per_s = 0.0;
  if (timestamps.size() > 1) {
    const auto& earliest_timestamp = timestamps.front();
    const auto& latest_timestamp = timestamps.back();
    steps_per_s = static_cast<double>(latest_timestamp.step - earliest_timestamp.step)
        / (1e-9 * static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            latest_timestamp.time - earliest_timestamp.time).count()));
  }

  // Acceptance over the steps since the last stats line
  auto recent_acceptance = 0.0;
  auto recent_steps = sampler.iterations() - since_step;
  if (recent_steps > 0) {
    recent_acceptance = sampler.history().accepted()
        .middleRows(since_step, recent_steps).cast<double>().mean();
  }

  auto log_post = state.log_post();
  auto mean_x = Eigen::VectorXd(state.positions.colwise().mean().transpose());
  auto sigma_x0 = std::sqrt((state.positions.col(0).array() - mean_x[0]).square().mean());

  std::cerr << absl::StreamFormat("%.1f steps/s, ", steps_per_s)
            << absl::StreamFormat("Step %d, ", sampler.iterations())
            << absl::StreamFormat("log_post = [%.2f, %.2f] (mean %.2f), ",
                                  log_post.minCoeff(), log_post.maxCoeff(), log_post.mean())
            << absl::StreamFormat("acceptance = %.3f, ", recent_acceptance)
            << absl::StreamFormat("proposals built = %d, ", sampler.num_proposal_builds())
            << absl::StreamFormat("x[0] ~ %.4g +/- %.4g", mean_x[0], sigma_x0)
            << std::endl;
}

auto cli_main_loop(Processed_cmd_line& c) -> int {

  std::cout << "# Parallelism: " << (c.thread_pool->size() + 1) << "\n";

  auto& sampler = *c.sampler;

  // First chunk evaluates everything at p0; later chunks pick up exactly where the previous one left off
  auto first_chunk = std::min(c.log_every, c.steps);
  timestamps.push_back(Timestamp{sampler.iterations(), std::chrono::high_resolution_clock::now()});
  auto state = sampler.run(c.p0, first_chunk, c.update_interval);
  auto last_stats_step = int64_t{0};

  while (true) {
    timestamps.push_back(Timestamp{sampler.iterations(), std::chrono::high_resolution_clock::now()});
    if (timestamps.size() > k_max_timestamps) {
      timestamps.pop_front();
    }

    print_stats_line(sampler, state, last_stats_step);
    last_stats_step = sampler.iterations();

    if (sampler.iterations() >= c.steps) {
      break;
    }
    auto chunk = std::min(c.log_every, c.steps - sampler.iterations());
    state = sampler.run(state.positions, chunk, c.update_interval, state.log_prior, state.log_like, state.log_q);
  }

  auto acceptance_fraction = sampler.acceptance_fraction();
  std::cout << absl::StreamFormat("# Acceptance fraction per walker: min %.3f, mean %.3f, max %.3f\n",
                                  acceptance_fraction.minCoeff(),
                                  acceptance_fraction.mean(),
                                  acceptance_fraction.maxCoeff());
  auto mean_x = Eigen::VectorXd(state.positions.colwise().mean().transpose());
  std::cout << "# Final ensemble mean:";
  for (auto i = 0; i != mean_x.size(); ++i) {
    std::cout << absl::StreamFormat(" %.4g", mean_x[i]);
  }
  std::cout << "\n";

  return 0;
}

}  // namespace kombine

auto main(int argc, char** argv) -> int {
  using namespace kombine;

  absl::InitializeLog();

  auto c = process_args(argc, argv);

  return cli_main_loop(c);
}
