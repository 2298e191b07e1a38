// Copyright (c) BoxMin contributors

#pragma once

#include <Eigen/Core>

namespace boxmin {

/**
 * Solver iteration information exposed to an iteration callback.
 */
struct IterationInfo {
  /// The solver iteration.
  int iteration;

  /// The decision variables.
  const Eigen::VectorXd& x;

  /// The objective value f(x).
  double f;

  /// The gradient of the objective ∇f(x).
  const Eigen::VectorXd& g;

  /// The search direction the next line search will follow.
  const Eigen::VectorXd& direction;

  /// Which variables are currently fixed at one of their bounds.
  const Eigen::ArrayX<bool>& is_fixed;
};

}  // namespace boxmin
