// Copyright (c) BoxMin contributors

#pragma once

#include <cmath>
#include <limits>

#include <Eigen/Core>

#include "boxmin/optimization/bounds.hpp"
#include "boxmin/util/small_vector.hpp"

namespace boxmin {

/**
 * Tracks which variables are fixed at one of their bounds.
 *
 * Keeps the original bounds alongside a working copy in which a bound that
 * joined the working set reads as ±∞, so feasibility tests only see the bounds
 * a free variable can still run into.
 */
class WorkingSet {
 public:
  /**
   * Constructs a working set with every variable free.
   *
   * @param bounds Normalized bounds (missing sides are ±∞).
   */
  explicit WorkingSet(const Bounds& bounds)
      : m_bounds{bounds},
        m_lower{bounds.lower},
        m_upper{bounds.upper},
        m_is_fixed{Eigen::ArrayX<bool>::Constant(bounds.lower.rows(), false)} {
    m_fixed.reserve(bounds.lower.rows());
  }

  /// Returns the original bounds.
  const Bounds& bounds() const { return m_bounds; }

  /// Returns the lower bounds not in the working set.
  const Eigen::VectorXd& lower() const { return m_lower; }

  /// Returns the upper bounds not in the working set.
  const Eigen::VectorXd& upper() const { return m_upper; }

  /// Returns the fixed-flag mask.
  const Eigen::ArrayX<bool>& is_fixed() const { return m_is_fixed; }

  /// Returns whether variable i is fixed.
  bool is_fixed(int i) const { return m_is_fixed[i]; }

  /// Returns the fixed variables in the order they were fixed.
  const small_vector<int>& fixed_indices() const { return m_fixed; }

  /// Returns the number of fixed variables.
  int num_fixed() const { return static_cast<int>(m_fixed.size()); }

  /**
   * Fixes variable i at its lower bound.
   *
   * @param i The variable index.
   * @return The bound.
   */
  double fix_to_lower(int i) {
    double bound = m_lower[i];
    m_lower[i] = -std::numeric_limits<double>::infinity();
    fix(i);
    return bound;
  }

  /**
   * Fixes variable i at its upper bound.
   *
   * @param i The variable index.
   * @return The bound.
   */
  double fix_to_upper(int i) {
    double bound = m_upper[i];
    m_upper[i] = std::numeric_limits<double>::infinity();
    fix(i);
    return bound;
  }

  /**
   * Releases the variable stored at the given position of fixed_indices() and
   * restores the bound it sits on.
   *
   * Positions after the removed one shift down by one, so callers releasing
   * several variables should go from the highest position to the lowest.
   *
   * @param position Position in fixed_indices().
   * @param x The current iterate.
   * @return The released variable's index.
   */
  int release_at(int position, const Eigen::VectorXd& x) {
    int i = m_fixed[position];
    m_fixed.erase(m_fixed.begin() + position);
    m_is_fixed[i] = false;

    if (x[i] <= m_bounds.lower[i]) {
      m_lower[i] = m_bounds.lower[i];
    } else {
      m_upper[i] = m_bounds.upper[i];
    }

    return i;
  }

 private:
  Bounds m_bounds;
  Eigen::VectorXd m_lower;
  Eigen::VectorXd m_upper;
  Eigen::ArrayX<bool> m_is_fixed;
  small_vector<int> m_fixed;

  void fix(int i) {
    m_is_fixed[i] = true;
    m_fixed.emplace_back(i);
  }
};

}  // namespace boxmin
