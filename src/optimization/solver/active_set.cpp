// Copyright (c) BoxMin contributors

#include "boxmin/optimization/solver/active_set.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <Eigen/Core>
#include <fmt/core.h>

#include "boxmin/optimization/solver/exit_status.hpp"
#include "boxmin/optimization/solver/iteration_info.hpp"
#include "boxmin/optimization/solver/options.hpp"
#include "boxmin/util/assert.hpp"
#include "boxmin/util/eigen_formatter.hpp"
#include "boxmin/util/print.hpp"
#include "boxmin/util/small_vector.hpp"
#include "optimization/ldlt_factor.hpp"
#include "optimization/solver/line_search.hpp"
#include "optimization/solver/util/convergence.hpp"
#include "optimization/solver/util/lagrange_multiplier_estimate.hpp"
#include "optimization/solver/util/machine_constants.hpp"
#include "optimization/solver/util/working_set.hpp"
#include "util/print_diagnostics.hpp"
#include "util/scope_exit.hpp"
#include "util/scoped_profiler.hpp"
#include "util/solve_profiler.hpp"

// See docs/algorithms.md#Works_cited for citation definitions.
//
// See docs/algorithms.md#Active-set_method for an overview of the iteration.

namespace {

/**
 * Returns true if the options describe a well-posed solve.
 */
bool is_valid(const boxmin::Options& options) {
  return options.max_iterations > 0 && options.sufficient_decrease > 0.0 &&
         options.sufficient_decrease < 1.0 &&
         options.curvature > options.sufficient_decrease &&
         options.curvature < 1.0 && options.displacement_tolerance > 0.0 &&
         options.max_step_scale > 0.0;
}

/**
 * Variable leaving the active set along with the estimates that allowed it.
 */
struct ReleaseCandidate {
  /// Position in the working set's fixed index list.
  int position;
  /// Variable index.
  int index;
  /// Lagrange multiplier estimates.
  boxmin::LagrangeMultiplierEstimate multipliers;
};

}  // namespace

namespace boxmin {

ExitStatus active_set(
    const ActiveSetCallbacks& callbacks,
    std::span<std::function<bool(const IterationInfo& info)>>
        iteration_callbacks,
    const Options& options, const Bounds& bounds, Eigen::VectorXd& x,
    SolverStatus* status) {
  const auto solve_start_time = std::chrono::steady_clock::now();

  small_vector<SolveProfiler> solve_profilers;
  solve_profilers.emplace_back("solver");
  solve_profilers.emplace_back("  ↳ setup");
  solve_profilers.emplace_back("  ↳ iteration");
  solve_profilers.emplace_back("    ↳ iteration callbacks");
  solve_profilers.emplace_back("    ↳ line search");
  solve_profilers.emplace_back("    ↳ release test");
  solve_profilers.emplace_back("    ↳ factor update");
  solve_profilers.emplace_back("    ↳ direction solve");
  solve_profilers.emplace_back("    ↳ f(x)");
  solve_profilers.emplace_back("    ↳ ∇f(x)");
  solve_profilers.emplace_back("    ↳ ∇²f(x) row");

  auto& solver_prof = solve_profilers[0];
  auto& setup_prof = solve_profilers[1];
  auto& inner_iter_prof = solve_profilers[2];
  auto& iteration_callbacks_prof = solve_profilers[3];
  auto& line_search_prof = solve_profilers[4];
  auto& release_test_prof = solve_profilers[5];
  auto& factor_update_prof = solve_profilers[6];
  auto& direction_solve_prof = solve_profilers[7];
  auto& f_prof = solve_profilers[8];
  auto& g_prof = solve_profilers[9];
  auto& H_prof = solve_profilers[10];

  solver_prof.start();
  setup_prof.start();

  const int num_decision_variables = x.rows();
  boxmin_assert(num_decision_variables > 0);

  // Set up profiled callbacks
  auto f_fn = [&](const Eigen::VectorXd& x) -> double {
    ScopedProfiler prof{f_prof};
    return callbacks.f(x);
  };
  auto g_fn = [&](const Eigen::VectorXd& x) -> Eigen::VectorXd {
    ScopedProfiler prof{g_prof};
    Eigen::VectorXd g = callbacks.g(x);
    boxmin_assert(g.rows() == num_decision_variables);
    return g;
  };
  auto H_row_fn = [&](const Eigen::VectorXd& x,
                      int i) -> std::optional<Eigen::VectorXd> {
    if (!callbacks.H_row) {
      return std::nullopt;
    }
    ScopedProfiler prof{H_prof};
    auto row = callbacks.H_row(x, i);
    boxmin_assert(!row || row->rows() == num_decision_variables);
    return row;
  };

  ExitStatus exit_status = ExitStatus::SUCCESS;
  double f = std::numeric_limits<double>::quiet_NaN();
  int iterations = 0;
  int diagnostic_rows = 0;

  // Prints final solver diagnostics when the solver exits
  scope_exit exit{[&] {
    if (options.diagnostics) {
      solver_prof.stop();
      if (diagnostic_rows > 0) {
        print_bottom_iteration_diagnostics();
      }
      boxmin::println("\nExit: {}", to_message(exit_status));
      print_solver_diagnostics(solve_profilers);
    }
  }};

  // Reports an exit before the working set exists
  auto reject = [&](ExitStatus reason) {
    exit_status = reason;
    if (status != nullptr) {
      *status = SolverStatus{reason, f, 0, {}, {}};
    }
    return reason;
  };

  if (!is_valid(options)) {
    return reject(ExitStatus::INVALID_OPTIONS);
  }

  const Bounds box = bounds.normalized();
  if (!box.is_valid(num_decision_variables)) {
    return reject(ExitStatus::INVALID_BOUNDS);
  }
  if (!box.contains(x)) {
    return reject(ExitStatus::INFEASIBLE_INITIAL_GUESS);
  }

  f = f_fn(x);
  Eigen::VectorXd g = g_fn(x);

  // Check whether initial guess has finite f(xₖ) and ∇f(xₖ)
  if (!std::isfinite(f) || !g.allFinite()) {
    return reject(ExitStatus::NONFINITE_INITIAL_COST_OR_GRADIENT);
  }

  const MachineConstants constants;
  const double zero = constants.zero;

  WorkingSet working_set{box};
  LDLTFactor factor{num_decision_variables, constants};
  LineSearch line_search{f_fn, g_fn, options, constants};

  // The first direction is steepest descent since B₀ = I
  Eigen::VectorXd d = -g;

  // Largest step norm the line search may take
  const double max_step =
      options.max_step_scale *
      std::max(g.norm(), static_cast<double>(num_decision_variables));

  // Buffers reused across iterations
  Eigen::VectorXd x_old{num_decision_variables};
  Eigen::VectorXd g_old{num_decision_variables};
  Eigen::VectorXd Δx{num_decision_variables};
  Eigen::VectorXd Δg{num_decision_variables};
  small_vector<ReleaseCandidate> candidates;

  // Variables released by the previous release test, for detecting cycles
  std::optional<small_vector<int>> prev_released;

  // Whether the last pass was a zero step, which doesn't start a new
  // iteration
  bool after_zero_step = false;

  setup_prof.stop();

  // Records the outcome and the active set
  auto finish = [&](ExitStatus reason, std::string message = {}) {
    exit_status = reason;
    if (status != nullptr) {
      status->exit_status = reason;
      status->cost = f;
      status->iterations = iterations;
      status->active_set = working_set.fixed_indices();
      status->message = std::move(message);
    }
    return reason;
  };

  while (iterations < options.max_iterations) {
    ScopedProfiler inner_iter_profiler{inner_iter_prof};

    // Check for solve timeout
    if (std::chrono::steady_clock::now() - solve_start_time >
        options.timeout) {
      return finish(ExitStatus::TIMEOUT);
    }

    if (!after_zero_step) {
      ScopedProfiler iteration_callbacks_profiler{iteration_callbacks_prof};

      // Call iteration callbacks
      for (const auto& callback : iteration_callbacks) {
        if (callback({iterations, x, f, g, d, working_set.is_fixed()})) {
          return finish(ExitStatus::CALLBACK_REQUESTED_STOP);
        }
      }
    }

    x_old = x;
    g_old = g;
    const double f_old = f;

    ScopedProfiler line_search_profiler{line_search_prof};

    if (auto ls_status = line_search.search(x_old, f_old, g_old, d, max_step,
                                            working_set, x, f);
        ls_status != ExitStatus::SUCCESS) {
      x = x_old;
      f = f_old;
      return finish(ls_status, line_search.message());
    }

    line_search_profiler.stop();

    IterationType iteration_type = IterationType::NORMAL;
    const auto& is_fixed = working_set.is_fixed();

    if (line_search.step_type() == StepType::ZERO_STEP) {
      // Variables were pinned without moving; drop them from the
      // factorization and retry without charging the budget
      after_zero_step = true;
      iteration_type = IterationType::PINNED;

      for (int i : working_set.fixed_indices()) {
        factor.remove(i);
      }

      f = f_fn(x);
      g = g_fn(x);
    } else {
      after_zero_step = false;
      ++iterations;

      if (line_search.has_gradient()) {
        g = line_search.gradient();
      } else {
        g = g_fn(x);
      }

      Δx = x - x_old;
      Δg = (!is_fixed).select(g - g_old, 0.0);

      // ΔgᵀΔx over the free variables
      double curvature = Δx.dot(Δg);

      // Curvature contributed by the variables fixed during this step
      double newly_bounded_curvature =
          is_fixed.select(Δx.cwiseProduct(g - g_old), 0.0).sum();

      // Convergence tests of [4] section 7.2
      bool finished = relative_displacement(x, x_old) < zero ||
                      relative_gradient(g, d, f) < zero ||
                      std::abs(curvature + newly_bounded_curvature) < zero;

      bool update = true;

      if (finished) {
        ScopedProfiler release_test_profiler{release_test_prof};

        // Test whether any fixed variable should leave its bound. Positions
        // are collected from the back so releasing them in order keeps the
        // remaining positions valid.
        candidates.clear();
        bool has_second_order = false;
        const auto& fixed = working_set.fixed_indices();
        for (int position = static_cast<int>(fixed.size()) - 1; position >= 0;
             --position) {
          int i = fixed[position];

          const Bounds& original = working_set.bounds();
          auto λ_1 = first_order_multiplier(x[i], g[i], original.lower[i],
                                            original.upper[i]);
          if (!λ_1) {
            return finish(
                ExitStatus::INCONSISTENT_ACTIVE_SET,
                fmt::format("x[{}] = {} is fixed but not on its bounds [{}, {}]",
                            i, x[i], original.lower[i], original.upper[i]));
          }

          // Second-order correction Σⱼ Hᵢⱼdⱼ over the free variables
          double Δλ = 0.0;
          if (auto H_i = H_row_fn(x, i)) {
            has_second_order = true;
            Δλ = (!is_fixed).select(H_i->cwiseProduct(d), 0.0).sum();
          }

          LagrangeMultiplierEstimate multipliers{*λ_1, *λ_1 + Δλ};
          if (multipliers.allows_release()) {
            candidates.push_back({position, i, multipliers});
          }
        }

        small_vector<int> released;
        released.reserve(candidates.size());
        for (const auto& candidate : candidates) {
          released.emplace_back(candidate.index);
        }
        std::sort(released.begin(), released.end());

        // Without Hessian information the same release set can come back
        // every time; treat a repeat as convergence
        bool is_cycle = !has_second_order && prev_released &&
                        *prev_released == released;
        prev_released = std::move(released);

        if (candidates.empty() || is_cycle) {
          release_test_profiler.stop();
          f = f_fn(x);
          if (options.diagnostics) {
            inner_iter_profiler.stop();
            print_iteration_diagnostics(
                diagnostic_rows++, iterations, IterationType::NORMAL,
                inner_iter_profiler.current_duration(), f,
                (!is_fixed).select(g, 0.0).lpNorm<Eigen::Infinity>(),
                line_search.step_length(), working_set.num_fixed());
          }
          return finish(ExitStatus::SUCCESS);
        }

        for (const auto& candidate : candidates) {
          int i = working_set.release_at(candidate.position, x);
          factor.restore(i);
          if (options.diagnostics) {
            print_released_variable(i, x[i],
                                    candidate.multipliers.first_order,
                                    candidate.multipliers.second_order);
          }
        }

        iteration_type = IterationType::RELEASED;
        update = false;
      }

      if (update) {
        // Skip the update unless ΔgᵀΔx is sufficiently positive
        double threshold = std::max(
            zero * (!is_fixed).select(Δx, 0.0).norm() * Δg.norm(), zero);
        if (curvature < threshold) {
          update = false;
          if (options.diagnostics) {
            print_skipped_update(curvature, threshold);
          }
        }
      }

      if (update) {
        ScopedProfiler factor_update_profiler{factor_update_prof};

        // BFGS update B + ΔgΔgᵀ/(ΔgᵀΔx) + g_old g_oldᵀ/(g_oldᵀd)
        if (factor.rank_one_update(Δg, 1.0 / curvature, is_fixed).info() !=
            Eigen::Success) {
          return finish(ExitStatus::NONFINITE_FACTORIZATION,
                        fmt::format("rank-one increase with ΔgᵀΔx = {}: {}",
                                    curvature, factor.error_message()));
        }
        if (factor
                .rank_one_update(g_old, 1.0 / line_search.slope(), is_fixed)
                .info() != Eigen::Success) {
          return finish(ExitStatus::NONFINITE_FACTORIZATION,
                        fmt::format("rank-one decrease with gᵀd = {}: {}",
                                    line_search.slope(),
                                    factor.error_message()));
        }
      }
    }

    ScopedProfiler direction_solve_profiler{direction_solve_prof};

    // Solve LDLᵀd = −g over the free variables
    d = factor.solve(-g, working_set.is_fixed());
    if (factor.info() != Eigen::Success) {
      return finish(ExitStatus::NONFINITE_DIRECTION,
                    fmt::format("{} with D = {:sfl}", factor.error_message(),
                                factor.D()));
    }

    direction_solve_profiler.stop();
    inner_iter_profiler.stop();

    if (options.diagnostics) {
      print_iteration_diagnostics(
          diagnostic_rows++, iterations, iteration_type,
          inner_iter_profiler.current_duration(), f,
          (!working_set.is_fixed()).select(g, 0.0).lpNorm<Eigen::Infinity>(),
          line_search.step_length(), working_set.num_fixed());
    }
  }

  return finish(ExitStatus::MAX_ITERATIONS_EXCEEDED);
}

}  // namespace boxmin
