// Copyright (c) BoxMin contributors

#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#include <boxmin/optimization/solver/active_set.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Eigen/Core>

#include "catch_string_converters.hpp"
#include "toy_problems.hpp"

using Catch::Matchers::WithinAbs;

namespace {

using IterationCallback = std::function<bool(const boxmin::IterationInfo&)>;

/**
 * f(x, y) = (x − 1)² + 5(y − 3)² + 3(x − 1)(y − 3), minimized at (1, 3).
 */
boxmin::ActiveSetCallbacks coupled_bowl() {
  Eigen::MatrixXd H{2, 2};
  // clang-format off
  H << 2.0,  3.0,
       3.0, 10.0;
  // clang-format on
  return quadratic(H, H * Eigen::Vector2d{1.0, 3.0});
}

boxmin::ExitStatus solve(const boxmin::ActiveSetCallbacks& callbacks,
                         const boxmin::Bounds& bounds, Eigen::VectorXd& x,
                         boxmin::SolverStatus* status,
                         std::span<IterationCallback> iteration_callbacks = {},
                         const boxmin::Options& options = boxmin::Options{}) {
  return boxmin::active_set(callbacks, iteration_callbacks, options, bounds, x,
                            status);
}

}  // namespace

TEST_CASE("active_set - Unconstrained quadratic", "[active_set]") {
  const auto callbacks = quadratic_form(spd_matrix());

  for (const Eigen::Vector3d& x0 :
       {Eigen::Vector3d{1.0, 1.0, 1.0}, Eigen::Vector3d{-5.0, 2.0, 7.0},
        Eigen::Vector3d{10.0, -10.0, 3.0}}) {
    Eigen::VectorXd x = x0;
    boxmin::SolverStatus status;

    CHECK(solve(callbacks, boxmin::Bounds::unbounded(3), x, &status) ==
          boxmin::ExitStatus::SUCCESS);
    CHECK(x.lpNorm<Eigen::Infinity>() < 1e-4);
    CHECK(status.iterations <= 10);
    CHECK(status.active_set.empty());
    CHECK(status.message.empty());
  }
}

TEST_CASE("active_set - Active bounds", "[active_set]") {
  const Eigen::Vector3d b{8.0, -6.0, 1.0};
  const auto callbacks = quadratic(spd_matrix(), b);
  const boxmin::Bounds bounds{Eigen::Vector3d::Constant(-1.0),
                              Eigen::Vector3d::Constant(1.0)};

  auto use_hessian = GENERATE(true, false);

  auto problem_callbacks = callbacks;
  if (!use_hessian) {
    problem_callbacks.H_row = nullptr;
  }

  Eigen::VectorXd x = Eigen::Vector3d::Zero();
  boxmin::SolverStatus status;

  CHECK(solve(problem_callbacks, bounds, x, &status) ==
        boxmin::ExitStatus::SUCCESS);

  // The first two coordinates leave the box unconstrained, so they end up
  // exactly on the nearest bound
  CHECK(x[0] == 1.0);
  CHECK(x[1] == -1.0);
  CHECK_THAT(x[2], WithinAbs(0.35, 1e-6));
  CHECK_THAT(status.cost, WithinAbs(-11.6225, 1e-8));

  REQUIRE(status.active_set.size() == 2);
  CHECK(((status.active_set[0] == 0 && status.active_set[1] == 1) ||
         (status.active_set[0] == 1 && status.active_set[1] == 0)));

  // The gradient pushes each fixed variable out of the box
  Eigen::VectorXd g = callbacks.g(x);
  CHECK(g[0] < 0.0);
  CHECK(g[1] > 0.0);
}

TEST_CASE("active_set - Fixed variable is released", "[active_set]") {
  auto use_hessian = GENERATE(true, false);
  auto start = GENERATE(0.0, 0.001);

  auto callbacks = coupled_bowl();
  if (!use_hessian) {
    callbacks.H_row = nullptr;
  }

  const boxmin::Bounds bounds{Eigen::Vector2d{0.0, -inf},
                              Eigen::Vector2d{10.0, inf}};

  // Record whether x was ever fixed
  bool was_fixed = false;
  std::vector<IterationCallback> iteration_callbacks{
      [&](const boxmin::IterationInfo& info) {
        was_fixed = was_fixed || info.is_fixed[0];
        return false;
      }};

  Eigen::VectorXd x = Eigen::Vector2d{start, 4.0};
  boxmin::SolverStatus status;

  CHECK(solve(callbacks, bounds, x, &status, iteration_callbacks) ==
        boxmin::ExitStatus::SUCCESS);
  CHECK(was_fixed);
  CHECK_THAT(x[0], WithinAbs(1.0, 1e-6));
  CHECK_THAT(x[1], WithinAbs(3.0, 1e-6));
  CHECK(status.active_set.empty());
}

TEST_CASE("active_set - Repeated release set", "[active_set]") {
  // Minimized over [-1, 1]² at (−2/9, −1). From (−0.5, 1), x is first fixed
  // at its upper bound, released, then fixed at its lower bound, where the
  // release test offers it again.
  Eigen::MatrixXd A{2, 2};
  // clang-format off
  A <<  9.0, -4.0,
       -4.0,  3.0;
  // clang-format on
  auto callbacks = quadratic(A, Eigen::Vector2d{2.0, -6.0});

  const boxmin::Bounds bounds{Eigen::Vector2d{-1.0, -1.0},
                              Eigen::Vector2d{1.0, 1.0}};

  // Count how many times x leaves the active set
  int releases = 0;
  bool was_fixed = false;
  std::vector<IterationCallback> iteration_callbacks{
      [&](const boxmin::IterationInfo& info) {
        if (was_fixed && !info.is_fixed[0]) {
          ++releases;
        }
        was_fixed = info.is_fixed[0];
        return false;
      }};

  Eigen::VectorXd x = Eigen::Vector2d{-0.5, 1.0};
  boxmin::SolverStatus status;

  SECTION("Without Hessian rows the repeat ends the solve") {
    callbacks.H_row = nullptr;

    CHECK(solve(callbacks, bounds, x, &status, iteration_callbacks) ==
          boxmin::ExitStatus::SUCCESS);
    CHECK(releases == 1);
    CHECK(x == Eigen::Vector2d{-1.0, -1.0});
    CHECK(status.cost == -2.0);
    CHECK(status.active_set.size() == 2);

    // The first-order estimate still asks for x to be released
    CHECK(callbacks.g(x)[0] < 0.0);
  }

  SECTION("Hessian rows let the release go through") {
    CHECK(solve(callbacks, bounds, x, &status, iteration_callbacks) ==
          boxmin::ExitStatus::SUCCESS);
    CHECK(releases == 2);
    CHECK_THAT(x[0], WithinAbs(-2.0 / 9.0, 1e-6));
    CHECK(x[1] == -1.0);
    REQUIRE(status.active_set.size() == 1);
    CHECK(status.active_set[0] == 1);
  }
}

TEST_CASE("active_set - Gradient isn't reevaluated at the accepted point",
          "[active_set]") {
  auto callbacks = rosenbrock();

  std::vector<Eigen::VectorXd> gradient_points;
  auto g = callbacks.g;
  callbacks.g = [&](const Eigen::VectorXd& x) -> Eigen::VectorXd {
    gradient_points.push_back(x);
    return g(x);
  };

  Eigen::VectorXd x = Eigen::Vector2d{-1.2, 1.0};
  boxmin::SolverStatus status;

  CHECK(solve(callbacks, boxmin::Bounds::unbounded(2), x, &status) ==
        boxmin::ExitStatus::SUCCESS);

  REQUIRE(gradient_points.size() > 1);
  for (size_t i = 1; i < gradient_points.size(); ++i) {
    INFO("evaluation " << i);
    CHECK(gradient_points[i] != gradient_points[i - 1]);
  }
  CHECK(static_cast<int>(gradient_points.size()) < 2 * status.iterations);
}

TEST_CASE("active_set - Monotone decrease", "[active_set]") {
  std::vector<double> costs;
  std::vector<IterationCallback> iteration_callbacks{
      [&](const boxmin::IterationInfo& info) {
        costs.push_back(info.f);
        return false;
      }};

  SECTION("Bounded Rosenbrock") {
    Eigen::VectorXd x = Eigen::Vector2d{-1.2, 1.0};
    boxmin::SolverStatus status;
    CHECK(solve(rosenbrock(),
                boxmin::Bounds{Eigen::Vector2d{-2.0, -2.0},
                               Eigen::Vector2d{0.5, 2.0}},
                x, &status, iteration_callbacks) ==
          boxmin::ExitStatus::SUCCESS);
  }

  SECTION("Release") {
    Eigen::VectorXd x = Eigen::Vector2d{0.0, 4.0};
    boxmin::SolverStatus status;
    CHECK(solve(coupled_bowl(),
                boxmin::Bounds{Eigen::Vector2d{0.0, -inf},
                               Eigen::Vector2d{10.0, inf}},
                x, &status, iteration_callbacks) ==
          boxmin::ExitStatus::SUCCESS);
  }

  REQUIRE(costs.size() > 1);
  for (size_t i = 1; i < costs.size(); ++i) {
    CHECK(costs[i] <= costs[i - 1]);
  }
}

TEST_CASE("active_set - Iteration budget", "[active_set]") {
  boxmin::Options options;
  options.max_iterations = 5;

  Eigen::VectorXd x = Eigen::Vector2d{-1.2, 1.0};
  boxmin::SolverStatus status;

  CHECK(solve(rosenbrock(), boxmin::Bounds::unbounded(2), x, &status, {},
              options) == boxmin::ExitStatus::MAX_ITERATIONS_EXCEEDED);
  CHECK(status.iterations == 5);
  CHECK(status.cost == rosenbrock().f(x));
  CHECK(status.cost < rosenbrock().f(Eigen::Vector2d{-1.2, 1.0}));

  // Continuing from the last iterate converges
  CHECK(solve(rosenbrock(), boxmin::Bounds::unbounded(2), x, &status) ==
        boxmin::ExitStatus::SUCCESS);
  CHECK_THAT(x[0], WithinAbs(1.0, 1e-4));
  CHECK_THAT(x[1], WithinAbs(1.0, 1e-4));
}

TEST_CASE("active_set - Callback requested stop", "[active_set]") {
  std::vector<IterationCallback> iteration_callbacks{
      [](const boxmin::IterationInfo& info) { return info.iteration == 2; }};

  Eigen::VectorXd x = Eigen::Vector2d{-1.2, 1.0};
  boxmin::SolverStatus status;

  CHECK(solve(rosenbrock(), boxmin::Bounds::unbounded(2), x, &status,
              iteration_callbacks) ==
        boxmin::ExitStatus::CALLBACK_REQUESTED_STOP);
  CHECK(status.iterations == 2);
}

TEST_CASE("active_set - Timeout", "[active_set]") {
  boxmin::Options options;
  options.timeout = std::chrono::duration<double>{0.0};

  Eigen::VectorXd x = Eigen::Vector2d{-1.2, 1.0};
  boxmin::SolverStatus status;

  CHECK(solve(rosenbrock(), boxmin::Bounds::unbounded(2), x, &status, {},
              options) == boxmin::ExitStatus::TIMEOUT);
  CHECK(x == Eigen::Vector2d{-1.2, 1.0});
}

TEST_CASE("active_set - Invalid input", "[active_set]") {
  int evaluations = 0;
  boxmin::ActiveSetCallbacks callbacks{
      [&](const Eigen::VectorXd& x) {
        ++evaluations;
        return x.squaredNorm();
      },
      [&](const Eigen::VectorXd& x) -> Eigen::VectorXd {
        ++evaluations;
        return 2.0 * x;
      },
      {}};

  const auto bounds = boxmin::Bounds{Eigen::Vector2d{-1.0, -1.0},
                                     Eigen::Vector2d{1.0, 1.0}};
  Eigen::VectorXd x = Eigen::Vector2d{0.5, 0.5};
  boxmin::SolverStatus status;

  SECTION("Options") {
    boxmin::Options options;

    SECTION("Iteration budget") { options.max_iterations = 0; }
    SECTION("Sufficient decrease") { options.sufficient_decrease = 1.0; }
    SECTION("Curvature below sufficient decrease") {
      options.sufficient_decrease = 0.5;
      options.curvature = 0.4;
    }
    SECTION("Displacement tolerance") { options.displacement_tolerance = 0.0; }
    SECTION("Step scale") { options.max_step_scale = -1.0; }

    CHECK(solve(callbacks, bounds, x, &status, {}, options) ==
          boxmin::ExitStatus::INVALID_OPTIONS);
    CHECK(evaluations == 0);
  }

  SECTION("Bounds") {
    SECTION("Crossed") {
      CHECK(solve(callbacks,
                  boxmin::Bounds{Eigen::Vector2d{-1.0, 1.0},
                                 Eigen::Vector2d{1.0, -1.0}},
                  x, &status) == boxmin::ExitStatus::INVALID_BOUNDS);
    }
    SECTION("Size mismatch") {
      CHECK(solve(callbacks, boxmin::Bounds::unbounded(3), x, &status) ==
            boxmin::ExitStatus::INVALID_BOUNDS);
    }
    CHECK(evaluations == 0);
  }

  SECTION("Initial guess outside the box") {
    x[1] = 1.5;
    CHECK(solve(callbacks, bounds, x, &status) ==
          boxmin::ExitStatus::INFEASIBLE_INITIAL_GUESS);
    CHECK(evaluations == 0);
  }

  SECTION("Non-finite initial guess") {
    x[0] = std::numeric_limits<double>::quiet_NaN();
    CHECK(solve(callbacks, bounds, x, &status) ==
          boxmin::ExitStatus::INFEASIBLE_INITIAL_GUESS);
  }

  SECTION("Non-finite initial cost") {
    callbacks.f = [](const Eigen::VectorXd&) { return inf; };
    CHECK(solve(callbacks, bounds, x, &status) ==
          boxmin::ExitStatus::NONFINITE_INITIAL_COST_OR_GRADIENT);
  }

  CHECK(status.exit_status != boxmin::ExitStatus::SUCCESS);
  CHECK(status.iterations == 0);
}

TEST_CASE("active_set - Non-finite gradient is a fatal defect",
          "[active_set]") {
  const Eigen::Vector2d start{0.0, 1.0};

  // The gradient is only defined at the initial guess
  boxmin::ActiveSetCallbacks callbacks{
      [](const Eigen::VectorXd& x) {
        return std::pow(x[0] - 3.0, 2) + std::pow(x[1] - 1.0, 2);
      },
      [&](const Eigen::VectorXd& x) -> Eigen::VectorXd {
        if (x == start) {
          return Eigen::Vector2d{-6.0, 0.0};
        }
        return Eigen::Vector2d::Constant(
            std::numeric_limits<double>::quiet_NaN());
      },
      {}};

  Eigen::VectorXd x = start;
  boxmin::SolverStatus status;

  auto exit_status = solve(callbacks, boxmin::Bounds::unbounded(2), x, &status);
  CHECK(boxmin::is_fatal(exit_status));
  CHECK(status.exit_status == exit_status);
  CHECK_FALSE(status.message.empty());
}

TEST_CASE("active_set - Gradient of the wrong size throws", "[active_set]") {
  boxmin::ActiveSetCallbacks callbacks{
      [](const Eigen::VectorXd& x) { return x.squaredNorm(); },
      [](const Eigen::VectorXd& x) -> Eigen::VectorXd {
        return Eigen::VectorXd::Zero(x.rows() + 1);
      },
      {}};

  Eigen::VectorXd x = Eigen::Vector2d{0.5, 0.5};

  CHECK_THROWS_AS(
      solve(callbacks, boxmin::Bounds::unbounded(2), x, nullptr),
      std::invalid_argument);
}
