#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <cmath>
#include <limits>
#include <numbers>
#include <random>

#include "absl/random/distributions.h"

#include "gaussian_proposal.h"

namespace kombine {

static auto random_ensemble(int num_walkers, int dim, std::mt19937_64& bitgen) -> Positions {
  auto result = Positions(num_walkers, dim);
  for (auto k = 0; k != num_walkers; ++k) {
    for (auto i = 0; i != dim; ++i) {
      result(k, i) = absl::Gaussian(bitgen, 3.0 * i, 1.0 + i);
    }
  }
  return result;
}

TEST(Gaussian_proposal_test, invalid) {
  auto ensemble = Positions(3, 1);
  ensemble << 0.0, 1.0, 2.0;

  EXPECT_THROW((Gaussian_proposal{Positions(1, 2), nullptr}), std::invalid_argument);
  EXPECT_THROW((Gaussian_proposal{ensemble, nullptr, 0.0}), std::invalid_argument);
  EXPECT_THROW((Gaussian_proposal{ensemble, nullptr, -2.0}), std::invalid_argument);
  EXPECT_THROW((Gaussian_proposal{ensemble, nullptr, std::numeric_limits<double>::infinity()}),
               std::invalid_argument);
  EXPECT_THROW((Gaussian_proposal{ensemble, nullptr, std::numeric_limits<double>::quiet_NaN()}),
               std::invalid_argument);
}

TEST(Gaussian_proposal_test, degenerate_ensemble) {
  // All walkers on the line y = 1
  auto collinear = Positions(4, 2);
  collinear <<
      0.0, 1.0,
      1.0, 1.0,
      2.0, 1.0,
      3.0, 1.0;
  EXPECT_THROW((Gaussian_proposal{collinear, nullptr}), std::invalid_argument);

  // All walkers at the same point
  EXPECT_THROW((Gaussian_proposal{Positions::Constant(5, 1, 1.5), nullptr}), std::invalid_argument);
}

TEST(Gaussian_proposal_test, fits_mean_and_covariance) {
  auto ensemble = Positions(4, 2);
  ensemble <<
      1.0, 2.0,
      3.0, 2.0,
      1.0, 6.0,
      3.0, 6.0;

  auto q = Gaussian_proposal{ensemble, nullptr};

  EXPECT_EQ(q.dim(), 2);
  EXPECT_EQ(q.scale(), 1.0);
  EXPECT_THAT(q.mean()[0], testing::DoubleNear(2.0, 1e-12));
  EXPECT_THAT(q.mean()[1], testing::DoubleNear(4.0, 1e-12));

  // Sample covariance normalized by N-1 = 3: var(x) = 4/3, var(y) = 16/3, cov(x,y) = 0
  auto cov = q.covariance();
  EXPECT_THAT(cov(0, 0), testing::DoubleNear(4.0 / 3.0, 1e-12));
  EXPECT_THAT(cov(1, 1), testing::DoubleNear(16.0 / 3.0, 1e-12));
  EXPECT_THAT(cov(0, 1), testing::DoubleNear(0.0, 1e-12));
  EXPECT_THAT(cov(1, 0), testing::DoubleNear(0.0, 1e-12));
}

TEST(Gaussian_proposal_test, scale_widens_covariance) {
  auto bitgen = std::mt19937_64(12345);
  auto ensemble = random_ensemble(20, 3, bitgen);

  auto q1 = Gaussian_proposal{ensemble, nullptr};
  auto q4 = Gaussian_proposal{ensemble, nullptr, 4.0};

  EXPECT_EQ(q4.scale(), 4.0);
  EXPECT_TRUE(q4.mean().isApprox(q1.mean()));
  EXPECT_TRUE(q4.covariance().isApprox(4.0 * q1.covariance(), 1e-12));
}

TEST(Gaussian_proposal_test, thread_pool_fit_matches_serial_fit) {
  auto bitgen = std::mt19937_64(12345);
  auto ensemble = random_ensemble(37, 4, bitgen);  // Doesn't split evenly
  auto thread_pool = ctpl::thread_pool{3};

  auto serial = Gaussian_proposal{ensemble, nullptr};
  auto parallel = Gaussian_proposal{ensemble, &thread_pool};

  for (auto i = 0; i != 4; ++i) {
    EXPECT_THAT(parallel.mean()[i], testing::DoubleNear(serial.mean()[i], 1e-12));
    for (auto j = 0; j != 4; ++j) {
      EXPECT_THAT(parallel.covariance()(i, j), testing::DoubleNear(serial.covariance()(i, j), 1e-12));
    }
  }

  auto x = random_ensemble(5, 4, bitgen);
  auto serial_log_q = serial.log_density(x);
  auto parallel_log_q = parallel.log_density(x);
  for (auto k = 0; k != 5; ++k) {
    EXPECT_THAT(parallel_log_q[k], testing::DoubleNear(serial_log_q[k], 1e-10));
  }
}

TEST(Gaussian_proposal_test, more_threads_than_walkers) {
  auto ensemble = Positions(2, 1);
  ensemble << -1.0, 1.0;
  auto thread_pool = ctpl::thread_pool{4};

  auto q = Gaussian_proposal{ensemble, &thread_pool};

  EXPECT_THAT(q.mean()[0], testing::DoubleNear(0.0, 1e-15));
  EXPECT_THAT(q.covariance()(0, 0), testing::DoubleNear(2.0, 1e-12));
}

TEST(Gaussian_proposal_test, log_density_1d) {
  // Mean 2, variance (1 + 1) / 1 = 2
  auto ensemble = Positions(2, 1);
  ensemble << 1.0, 3.0;
  auto q = Gaussian_proposal{ensemble, nullptr};

  auto x = Positions(3, 1);
  x << 2.0, 0.0, 5.5;
  auto log_q = q.log_density(x);

  ASSERT_EQ(log_q.size(), 3);
  for (auto k = 0; k != 3; ++k) {
    auto expected = -0.5 * std::log(2 * std::numbers::pi * 2.0) - (x(k, 0) - 2.0) * (x(k, 0) - 2.0) / (2 * 2.0);
    EXPECT_THAT(log_q[k], testing::DoubleNear(expected, 1e-12));
  }
}

TEST(Gaussian_proposal_test, log_density_correlated_2d) {
  auto ensemble = Positions(5, 2);
  ensemble <<
      0.0, 0.0,
      1.0, 1.5,
      2.0, 1.0,
      -1.0, -0.5,
      3.0, 2.0;
  auto q = Gaussian_proposal{ensemble, nullptr};

  auto m = q.mean();
  auto S = q.covariance();
  auto S_inv = Eigen::MatrixXd(S.inverse());

  auto x = Positions(3, 2);
  x <<
      0.5, 0.5,
      -2.0, 3.0,
      4.0, -1.0;
  auto log_q = q.log_density(x);

  for (auto k = 0; k != 3; ++k) {
    auto dx = Eigen::VectorXd(x.row(k).transpose() - m);
    auto expected = -std::log(2 * std::numbers::pi) - 0.5 * std::log(S.determinant()) - 0.5 * dx.dot(S_inv * dx);
    EXPECT_THAT(log_q[k], testing::DoubleNear(expected, 1e-10));
  }
}

TEST(Gaussian_proposal_test, density_integrates_to_one) {
  auto ensemble = Positions(4, 2);
  ensemble <<
      0.0, 0.0,
      1.0, 0.5,
      0.0, 1.0,
      -0.5, 0.2;
  auto q = Gaussian_proposal{ensemble, nullptr};

  // Midpoint rule over a box many standard deviations wide
  auto n = 400;
  auto lo = Eigen::Vector2d{q.mean()[0] - 10.0, q.mean()[1] - 10.0};
  auto h = 20.0 / n;
  auto grid = Positions(n, 2);
  auto total = 0.0;
  for (auto i = 0; i != n; ++i) {
    for (auto j = 0; j != n; ++j) {
      grid(j, 0) = lo[0] + (i + 0.5) * h;
      grid(j, 1) = lo[1] + (j + 0.5) * h;
    }
    total += q.log_density(grid).array().exp().sum() * h * h;
  }

  EXPECT_THAT(total, testing::DoubleNear(1.0, 1e-3));
}

TEST(Gaussian_proposal_test, draws_match_fitted_moments) {
  auto bitgen = std::mt19937_64(12345);
  auto ensemble = Positions(4, 2);
  ensemble <<
      1.0, 2.0,
      3.0, 3.0,
      1.0, 5.0,
      3.0, 6.0;
  auto q = Gaussian_proposal{ensemble, nullptr};

  auto n = 20000;
  auto x = q.draw(n, bitgen);
  ASSERT_EQ(x.rows(), n);
  ASSERT_EQ(x.cols(), 2);
  EXPECT_TRUE(x.allFinite());

  auto sample_mean = Eigen::VectorXd(x.colwise().mean().transpose());
  auto dx = Eigen::MatrixXd(x.rowwise() - sample_mean.transpose());
  auto sample_cov = Eigen::MatrixXd(dx.transpose() * dx / (n - 1));

  auto cov = q.covariance();
  for (auto i = 0; i != 2; ++i) {
    auto sigma_i = std::sqrt(cov(i, i));
    EXPECT_THAT(sample_mean[i], testing::DoubleNear(q.mean()[i], 5 * sigma_i / std::sqrt(n)));
    for (auto j = 0; j != 2; ++j) {
      EXPECT_THAT(sample_cov(i, j), testing::DoubleNear(cov(i, j), 0.05 * std::sqrt(cov(i, i) * cov(j, j))));
    }
  }
}

TEST(Gaussian_proposal_test, draw_zero) {
  auto bitgen = std::mt19937_64(12345);
  auto ensemble = Positions(3, 1);
  ensemble << 0.0, 1.0, 2.0;
  auto q = Gaussian_proposal{ensemble, nullptr};

  auto x = q.draw(0, bitgen);
  EXPECT_EQ(x.rows(), 0);
  EXPECT_EQ(x.cols(), 1);
}

TEST(Gaussian_proposal_test, dimension_mismatch) {
  auto ensemble = Positions(3, 1);
  ensemble << 0.0, 1.0, 2.0;
  auto q = Gaussian_proposal{ensemble, nullptr};

  EXPECT_THROW(q.log_density(Positions::Zero(2, 2)), std::invalid_argument);
}

TEST(Gaussian_proposal_test, factory) {
  auto ensemble = Positions(3, 1);
  ensemble << 0.0, 1.0, 2.0;

  auto proposal = Gaussian_proposal::factory(2.5)(ensemble, nullptr);

  ASSERT_NE(proposal, nullptr);
  auto* gaussian = dynamic_cast<Gaussian_proposal*>(proposal.get());
  ASSERT_NE(gaussian, nullptr);
  EXPECT_EQ(gaussian->scale(), 2.5);
  EXPECT_THAT(gaussian->covariance()(0, 0), testing::DoubleNear(2.5, 1e-12));
}

}  // namespace kombine
