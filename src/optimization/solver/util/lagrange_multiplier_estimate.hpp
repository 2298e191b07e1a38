// Copyright (c) BoxMin contributors

#pragma once

#include <algorithm>
#include <cmath>
#include <optional>

// See docs/algorithms.md#Works_cited for citation definitions

namespace boxmin {

/**
 * First- and second-order Lagrange multiplier estimates for a variable fixed
 * at one of its bounds.
 */
struct LagrangeMultiplierEstimate {
  /// Estimate from the gradient alone.
  double first_order = 0.0;

  /// First-order estimate plus the Hessian row's correction along the
  /// direction.
  double second_order = 0.0;

  /**
   * Returns true if the bound isn't binding, so the variable may leave it.
   *
   * Both estimates have to agree in sign, be close relative to each other and
   * be negative. See [3].
   */
  bool allows_release() const {
    double Δ = second_order - first_order;
    return first_order * second_order > 0.0 &&
           2.0 * std::abs(Δ) <
               std::min(std::abs(first_order), std::abs(second_order)) &&
           second_order < 0.0;
  }
};

/**
 * Returns the first-order Lagrange multiplier estimate of a fixed variable, or
 * std::nullopt if the variable isn't on either bound.
 *
 * At the upper bound the multiplier is −gᵢ; at the lower bound it's gᵢ.
 *
 * @param x_i The variable's value.
 * @param g_i The gradient's entry for the variable.
 * @param lower The variable's lower bound.
 * @param upper The variable's upper bound.
 */
inline std::optional<double> first_order_multiplier(double x_i, double g_i,
                                                    double lower,
                                                    double upper) {
  if (x_i >= upper) {
    return -g_i;
  } else if (x_i <= lower) {
    return g_i;
  } else {
    return std::nullopt;
  }
}

}  // namespace boxmin
