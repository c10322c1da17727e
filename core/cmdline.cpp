#include "cmdline.h"

#include <cstdlib>
#include <iostream>
#include <thread>

#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"
#include "cxxopts.hpp"

#include "gaussian_proposal.h"
#include "log_densities.h"
#include "version.h"

namespace kombine {

auto process_args(int argc, char** argv) -> Processed_cmd_line {

  cxxopts::Options options("kombine", "kombine - Ensemble MCMC with an adaptive independence proposal");

  options.add_options("Generic options")
      ("version", "print version string")
      ("h,help", "print usage")
      ;

  options.add_options("Sampler options")
      ("threads", "Number of threads used to fit proposals (default: use all cores)",
       cxxopts::value<int>())
      ("seed", "Initial random number seed (default: random)",
       cxxopts::value<uint32_t>())
      ("walkers", "Number of walkers in the ensemble (must exceed the number of dimensions)",
       cxxopts::value<int>()->default_value("32"))
      ("steps", "Total number of ensemble steps to run",
       cxxopts::value<int64_t>()->default_value("1000"))
      ("update-interval", "Steps between proposal rebuilds",
       cxxopts::value<int64_t>()->default_value("10"))
      ("log-every", "Steps between progress lines (default: steps / 10)",
       cxxopts::value<int64_t>())
      ("proposal-scale", "Factor by which the fitted ensemble covariance is widened in the proposal",
       cxxopts::value<double>()->default_value("1.0"))
      ;

  options.add_options("Target options")
      ("dim", "Number of dimensions of the target",
       cxxopts::value<int>()->default_value("2"))
      ("like-mean", "Mean of the Gaussian likelihood along every axis",
       cxxopts::value<double>()->default_value("1.0"))
      ("like-sigma", "Standard deviation of the Gaussian likelihood",
       cxxopts::value<double>()->default_value("0.5"))
      ("prior-sigma", "Standard deviation of the zero-mean Gaussian prior (walkers start as draws from it)",
       cxxopts::value<double>()->default_value("10.0"))
      ;

  try {
    auto opts = options.parse(argc, argv);

    if (opts.count("version")) {
      std::cout << absl::StreamFormat("kombine Version %s (build %d, commit %s)",
                                      k_kombine_version_string,
                                      k_kombine_build_number,
                                      k_kombine_commit_string) << "\n";
      std::exit(EXIT_SUCCESS);
    }
    if (opts.count("help")) {
      std::cout << options.help() << "\n";
      std::exit(EXIT_SUCCESS);
    }

    // Validate options
    auto threads = int{};
    if (opts.count("threads")) {
      threads = opts["threads"].as<int>();
    } else {
      threads = std::max(1u, std::thread::hardware_concurrency());
    }
    if (threads < 1) {
      std::cerr << "ERROR: threads must be positive, got " << threads << "\n";
      std::exit(EXIT_FAILURE);
    }
    // The calling thread fits one chunk of every proposal itself
    auto thread_pool = std::make_unique<ctpl::thread_pool>(threads - 1);

    auto seed = uint32_t{};
    if (opts.count("seed")) {
      seed = opts["seed"].as<uint32_t>();
    } else {
      seed = std::random_device{}();
    }
    auto prng = std::make_unique<std::mt19937>(seed);
    std::cerr << "# Seed: " << seed << "\n";

    auto dim = opts["dim"].as<int>();
    if (dim < 1) {
      std::cerr << "ERROR: dim must be positive, got " << dim << "\n";
      std::exit(EXIT_FAILURE);
    }
    auto walkers = opts["walkers"].as<int>();
    if (walkers <= dim) {
      std::cerr << absl::StreamFormat(
          "ERROR: need more walkers than dimensions to fit a proposal, got %d walkers in %d dimensions\n",
          walkers, dim);
      std::exit(EXIT_FAILURE);
    }
    auto steps = opts["steps"].as<int64_t>();
    if (steps < 1) {
      std::cerr << "ERROR: steps must be positive, got " << steps << "\n";
      std::exit(EXIT_FAILURE);
    }
    auto update_interval = opts["update-interval"].as<int64_t>();
    if (update_interval < 1) {
      std::cerr << "ERROR: update-interval must be positive, got " << update_interval << "\n";
      std::exit(EXIT_FAILURE);
    }
    auto log_every = int64_t{};
    if (opts.count("log-every")) {
      log_every = opts["log-every"].as<int64_t>();
    } else {
      log_every = std::max(int64_t{1}, steps / 10);
    }
    if (log_every < 1) {
      std::cerr << "ERROR: log-every must be positive, got " << log_every << "\n";
      std::exit(EXIT_FAILURE);
    }
    auto proposal_scale = opts["proposal-scale"].as<double>();
    if (not (proposal_scale > 0.0)) {
      std::cerr << "ERROR: proposal-scale must be positive, got " << proposal_scale << "\n";
      std::exit(EXIT_FAILURE);
    }
    auto like_sigma = opts["like-sigma"].as<double>();
    auto prior_sigma = opts["prior-sigma"].as<double>();
    if (not (like_sigma > 0.0) || not (prior_sigma > 0.0)) {
      std::cerr << "ERROR: like-sigma and prior-sigma must be positive\n";
      std::exit(EXIT_FAILURE);
    }

    auto log_prior = Gaussian_log_density{Eigen::VectorXd::Zero(dim), prior_sigma};
    auto log_like = Gaussian_log_density{
      Eigen::VectorXd::Constant(dim, opts["like-mean"].as<double>()), like_sigma};
    std::cerr << "# Prior: " << log_prior << "\n"
              << "# Likelihood: " << log_like << "\n";

    // Start the walkers off as draws from the prior
    auto p0 = Positions(walkers, dim);
    for (auto k = 0; k != walkers; ++k) {
      for (auto i = 0; i != dim; ++i) {
        p0(k, i) = absl::Gaussian(*prng, 0.0, prior_sigma);
      }
    }

    auto sampler = std::make_unique<Ensemble_sampler>(
        walkers, dim, log_prior, log_like,
        Gaussian_proposal::factory(proposal_scale),
        absl::BitGenRef{*prng},
        thread_pool.get());

    return {
      .thread_pool = std::move(thread_pool),
      .prng = std::move(prng),
      .sampler = std::move(sampler),
      .p0 = std::move(p0),
      .steps = steps,
      .update_interval = update_interval,
      .log_every = log_every
    };

  } catch (cxxopts::exceptions::exception& x) {
    std::cerr << "ERROR: " << x.what() << "\n" << options.help() << "\n";
    std::exit(EXIT_FAILURE);
  }
}

}  // namespace kombine
