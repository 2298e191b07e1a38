// Copyright (c) BoxMin contributors

#pragma once

#include <chrono>
#include <limits>

#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * Solver options.
 */
struct BOXMIN_DLLEXPORT Options {
  /// The maximum number of solver iterations before returning a solution.
  /// Steps that only pin variables to their bounds don't count.
  int max_iterations = 200;

  /// Sufficient decrease constant c₁ of the line search, which should be in
  /// (0, 1). A trial step λ is acceptable only if
  /// f(x + λd) ≤ f(x) + c₁λ∇f(x)ᵀd.
  double sufficient_decrease = 1e-4;

  /// Curvature constant c₂ of the line search, which should be in (c₁, 1).
  /// A trial step λ also has to satisfy ∇f(x + λd)ᵀd ≥ c₂∇f(x)ᵀd so the BFGS
  /// update keeps the Hessian approximation positive definite.
  double curvature = 0.9;

  /// Relative displacement below which the line search gives up shrinking
  /// the step.
  double displacement_tolerance = 1e-6;

  /// Scales the maximum step length, which is
  /// max_step_scale · max(‖∇f(x₀)‖, n).
  double max_step_scale = 100.0;

  /// The maximum elapsed wall clock time before returning a solution.
  std::chrono::duration<double> timeout{
      std::numeric_limits<double>::infinity()};

  /// Enables diagnostic prints.
  bool diagnostics = false;
};

}  // namespace boxmin
