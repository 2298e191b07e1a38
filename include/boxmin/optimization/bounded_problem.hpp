// Copyright (c) BoxMin contributors

#pragma once

#include <concepts>
#include <functional>
#include <optional>
#include <utility>

#include <Eigen/Core>

#include "boxmin/optimization/bounds.hpp"
#include "boxmin/optimization/solver/active_set.hpp"
#include "boxmin/optimization/solver/exit_status.hpp"
#include "boxmin/optimization/solver/iteration_info.hpp"
#include "boxmin/optimization/solver/options.hpp"
#include "boxmin/optimization/solver_status.hpp"
#include "boxmin/util/small_vector.hpp"
#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * This class allows the user to pose a bound-constrained minimization problem
 * and solve it, possibly in several installments.
 *
 * The problem has the form:
 *
 * @verbatim
 *      min_x f(x)
 * subject to l ≤ x ≤ u
 * @endverbatim
 *
 * where f(x) is a smooth objective whose gradient the user supplies, and l and
 * u are per-variable bounds. A missing bound is written as ±∞ or NaN.
 *
 * If a solve runs out of iterations, resume() continues from where it stopped
 * with a fresh iteration budget.
 */
class BOXMIN_DLLEXPORT BoundedProblem {
 public:
  /**
   * Constructs an unbounded problem in the given number of variables.
   *
   * @param num_decision_variables The number of decision variables.
   */
  explicit BoundedProblem(int num_decision_variables);

  /**
   * Returns the number of decision variables.
   */
  int num_decision_variables() const { return m_num_decision_variables; }

  /**
   * Tells the solver to minimize the given objective.
   *
   * @param f The objective function. May return ∞ where it's undefined.
   * @param g The objective's gradient.
   */
  void minimize(std::function<double(const Eigen::VectorXd& x)> f,
                std::function<Eigen::VectorXd(const Eigen::VectorXd& x)> g) {
    m_callbacks.f = std::move(f);
    m_callbacks.g = std::move(g);
  }

  /**
   * Supplies rows of the objective's Hessian.
   *
   * The rows sharpen the Lagrange multiplier estimates that decide whether a
   * variable leaves its bound. Without them, the solver stops if the same
   * variables would be released twice in a row.
   *
   * @param H_row Returns row i of ∇²f(x), or std::nullopt if it isn't
   *   available at x.
   */
  void hessian_row(
      std::function<std::optional<Eigen::VectorXd>(const Eigen::VectorXd& x,
                                                   int i)>
          H_row) {
    m_callbacks.H_row = std::move(H_row);
  }

  /**
   * Sets the bounds l ≤ x ≤ u.
   *
   * @param lower Lower bounds; -∞ or NaN means no bound.
   * @param upper Upper bounds; ∞ or NaN means no bound.
   */
  void bounds(Eigen::VectorXd lower, Eigen::VectorXd upper) {
    m_bounds = Bounds{std::move(lower), std::move(upper)};
  }

  /**
   * Returns the bounds.
   */
  const Bounds& bounds() const { return m_bounds; }

  /**
   * Solves the problem starting from x0.
   *
   * @param x0 The initial guess. Must lie within the bounds.
   * @param options Solver options.
   * @return The solver's exit status.
   */
  ExitStatus solve(const Eigen::VectorXd& x0,
                   const Options& options = Options{});

  /**
   * Continues the last solve from its last iterate with a fresh iteration
   * budget. Meant for solves that returned MAX_ITERATIONS_EXCEEDED or TIMEOUT.
   *
   * @param options Solver options.
   * @return The solver's exit status.
   */
  ExitStatus resume(const Options& options = Options{});

  /**
   * Returns the objective value at the last iterate.
   */
  double min_function() const { return m_status.cost; }

  /**
   * Returns the last iterate; the solution if the last solve succeeded.
   */
  const Eigen::VectorXd& last_iterate() const { return m_x; }

  /**
   * Returns the status of the last solve.
   */
  const SolverStatus& status() const { return m_status; }

  /**
   * Adds a callback to be called at the beginning of each solver iteration.
   *
   * The callback for this overload should return void.
   *
   * @param callback The callback.
   */
  template <typename F>
    requires requires(F callback, const IterationInfo& info) {
      { callback(info) } -> std::same_as<void>;
    }
  void add_callback(F&& callback) {
    m_iteration_callbacks.emplace_back(
        [=, callback = std::forward<F>(callback)](const IterationInfo& info) {
          callback(info);
          return false;
        });
  }

  /**
   * Adds a callback to be called at the beginning of each solver iteration.
   *
   * The callback for this overload should return bool.
   *
   * @param callback The callback. Returning true from the callback causes the
   *   solver to exit early with the solution it has so far.
   */
  template <typename F>
    requires requires(F callback, const IterationInfo& info) {
      { callback(info) } -> std::same_as<bool>;
    }
  void add_callback(F&& callback) {
    m_iteration_callbacks.emplace_back(std::forward<F>(callback));
  }

  /**
   * Clears the registered callbacks.
   */
  void clear_callbacks() { m_iteration_callbacks.clear(); }

 private:
  int m_num_decision_variables;

  ActiveSetCallbacks m_callbacks;
  Bounds m_bounds;

  small_vector<std::function<bool(const IterationInfo& info)>>
      m_iteration_callbacks;

  Eigen::VectorXd m_x;
  SolverStatus m_status;
};

}  // namespace boxmin
