// Copyright (c) BoxMin contributors

#pragma once

#include <cmath>
#include <limits>

#include <Eigen/Core>

#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * Per-variable box constraints lower ≤ x ≤ upper.
 *
 * A side without a bound is written as ±∞ or NaN; both mean the same thing.
 */
struct BOXMIN_DLLEXPORT Bounds {
  /// Lower bounds.
  Eigen::VectorXd lower;

  /// Upper bounds.
  Eigen::VectorXd upper;

  /**
   * Returns bounds that don't constrain any of the n variables.
   *
   * @param n Number of variables.
   */
  static Bounds unbounded(int n) {
    return Bounds{Eigen::VectorXd::Constant(
                      n, -std::numeric_limits<double>::infinity()),
                  Eigen::VectorXd::Constant(
                      n, std::numeric_limits<double>::infinity())};
  }

  /**
   * Returns a copy with NaN sides replaced by -∞ (lower) and ∞ (upper).
   */
  Bounds normalized() const {
    constexpr double inf = std::numeric_limits<double>::infinity();

    Bounds result{lower, upper};
    for (Eigen::Index i = 0; i < lower.rows(); ++i) {
      if (std::isnan(result.lower[i])) {
        result.lower[i] = -inf;
      }
    }
    for (Eigen::Index i = 0; i < upper.rows(); ++i) {
      if (std::isnan(result.upper[i])) {
        result.upper[i] = inf;
      }
    }
    return result;
  }

  /**
   * Returns true if both bound vectors have n entries and lower ≤ upper
   * everywhere. NaN entries are treated as missing bounds.
   *
   * @param n Number of variables.
   */
  bool is_valid(Eigen::Index n) const {
    constexpr double inf = std::numeric_limits<double>::infinity();

    if (lower.rows() != n || upper.rows() != n) {
      return false;
    }
    for (Eigen::Index i = 0; i < n; ++i) {
      if (lower[i] > upper[i] || lower[i] == inf || upper[i] == -inf) {
        return false;
      }
    }
    return true;
  }

  /**
   * Returns true if lower ≤ x ≤ upper holds for every finite x.
   *
   * @param x The point to check.
   */
  bool contains(const Eigen::VectorXd& x) const {
    if (x.rows() != lower.rows() || !x.allFinite()) {
      return false;
    }
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
      if (x[i] < lower[i] || x[i] > upper[i]) {
        return false;
      }
    }
    return true;
  }
};

}  // namespace boxmin
