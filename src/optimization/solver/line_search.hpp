// Copyright (c) BoxMin contributors

#pragma once

#include <stdint.h>

#include <functional>
#include <string>
#include <utility>

#include <Eigen/Core>

#include "boxmin/optimization/solver/exit_status.hpp"
#include "boxmin/optimization/solver/options.hpp"
#include "optimization/solver/util/machine_constants.hpp"
#include "optimization/solver/util/working_set.hpp"

// See docs/algorithms.md#Works_cited for citation definitions

namespace boxmin {

/**
 * Outcome of a line search that didn't hit a fatal defect.
 */
enum class StepType : uint8_t {
  /// A step satisfying the sufficient decrease condition was taken.
  NORMAL,
  /// Variables with a zero feasible step were pinned to their bounds; no step
  /// was taken.
  ZERO_STEP,
  /// The slope along the direction is zero, so the iterate is stationary
  /// over the free variables.
  STATIONARY,
  /// No acceptable step length exists; the iterate is unchanged.
  NO_PROGRESS
};

/**
 * Safeguarded backtracking line search for bound-constrained problems.
 *
 * Steps are clipped to the box. A step reaching the nearest bound along the
 * direction fixes that variable. Backtracking uses quadratic then cubic
 * interpolation as in [5] section 9.7; if the curvature condition fails, the
 * step is extrapolated and refined within the resulting bracket as in [4]
 * section 6.3.
 */
class LineSearch {
 public:
  /**
   * Constructs a line search.
   *
   * @param f Objective function. May return ∞ outside its domain.
   * @param g Gradient of the objective function.
   * @param options Solver options.
   * @param constants Machine constants.
   */
  LineSearch(std::function<double(const Eigen::VectorXd& x)> f,
             std::function<Eigen::VectorXd(const Eigen::VectorXd& x)> g,
             const Options& options, const MachineConstants& constants)
      : m_f{std::move(f)},
        m_g{std::move(g)},
        m_options{options},
        m_constants{constants} {}

  /**
   * Searches along d from x_old.
   *
   * @param[in] x_old The current iterate.
   * @param[in] f_old f(x_old).
   * @param[in] g_old ∇f(x_old).
   * @param[in,out] d The search direction. Scaled down if longer than max_step.
   * @param[in] max_step Largest allowed step norm.
   * @param[in,out] working_set Fixed variables and the bounds still free
   *   variables may reach. Variables that reach a bound are added.
   * @param[out] x The new iterate.
   * @param[out] f f(x).
   * @return SUCCESS, or a fatal defect whose context is in message().
   */
  ExitStatus search(const Eigen::VectorXd& x_old, double f_old,
                    const Eigen::VectorXd& g_old, Eigen::VectorXd& d,
                    double max_step, WorkingSet& working_set,
                    Eigen::VectorXd& x, double& f);

  /// Returns the kind of step the last search took.
  StepType step_type() const { return m_step_type; }

  /// Returns the accepted step length of the last search.
  double step_length() const { return m_λ; }

  /// Returns the directional derivative gᵀd of the last search.
  double slope() const { return m_slope; }

  /**
   * Returns whether the last search evaluated ∇f at the iterate it returned,
   * in which case gradient() holds it.
   */
  bool has_gradient() const { return m_has_gradient; }

  /// Returns ∇f at the returned iterate. Valid only if has_gradient().
  const Eigen::VectorXd& gradient() const { return m_g_x; }

  /// Returns context for the last fatal defect.
  const std::string& message() const { return m_message; }

 private:
  std::function<double(const Eigen::VectorXd& x)> m_f;
  std::function<Eigen::VectorXd(const Eigen::VectorXd& x)> m_g;
  Options m_options;
  MachineConstants m_constants;

  StepType m_step_type = StepType::NORMAL;
  double m_λ = 0.0;
  double m_slope = 0.0;
  std::string m_message;

  // ∇f at the most recent trial point, reused by the caller when that point
  // is accepted
  Eigen::VectorXd m_g_x;
  bool m_has_gradient = false;
};

}  // namespace boxmin
