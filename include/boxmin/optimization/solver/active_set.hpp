// Copyright (c) BoxMin contributors

#pragma once

#include <functional>
#include <optional>
#include <span>

#include <Eigen/Core>

#include "boxmin/optimization/bounds.hpp"
#include "boxmin/optimization/solver/exit_status.hpp"
#include "boxmin/optimization/solver/iteration_info.hpp"
#include "boxmin/optimization/solver/options.hpp"
#include "boxmin/optimization/solver_status.hpp"
#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * Objective callbacks for the active-set solver.
 */
struct BOXMIN_DLLEXPORT ActiveSetCallbacks {
  /// Objective value f(x) getter. May return ∞ where f is undefined; the line
  /// search then shortens the step.
  std::function<double(const Eigen::VectorXd& x)> f;

  /// Objective gradient ∇f(x) getter. Must return n rows.
  std::function<Eigen::VectorXd(const Eigen::VectorXd& x)> g;

  /// Optional Hessian row getter returning row i of ∇²f(x), or std::nullopt
  /// if that row isn't available. Leave empty if there's no Hessian at all.
  ///
  /// The rows are only used for second-order Lagrange multiplier estimates
  /// when deciding whether a fixed variable may leave its bound.
  std::function<std::optional<Eigen::VectorXd>(const Eigen::VectorXd& x,
                                               int i)>
      H_row;
};

/**
Finds a local minimizer of a bound-constrained problem with an active-set
quasi-Newton method.

The problem has the form:

@verbatim
     min_x f(x)
subject to l ≤ x ≤ u
@endverbatim

Free variables follow a BFGS direction computed from an LDLᵀ factorization of
the Hessian approximation. Variables that hit a bound are fixed there and
released again once their Lagrange multiplier estimate shows the bound isn't
binding.

@param[in] callbacks Objective, gradient and optional Hessian row callbacks.
@param[in] iteration_callbacks The list of callbacks to call at the beginning of
  each iteration.
@param[in] options Solver options.
@param[in] bounds Lower and upper bounds of each variable.
@param[in,out] x The initial guess and output location for the decision
  variables. The initial guess must lie inside the bounds.
@param[out] status Optional solver status, including the cost at x, the active
  set and context for fatal errors.
@return The exit status.
*/
BOXMIN_DLLEXPORT ExitStatus active_set(
    const ActiveSetCallbacks& callbacks,
    std::span<std::function<bool(const IterationInfo& info)>>
        iteration_callbacks,
    const Options& options, const Bounds& bounds, Eigen::VectorXd& x,
    SolverStatus* status = nullptr);

}  // namespace boxmin
