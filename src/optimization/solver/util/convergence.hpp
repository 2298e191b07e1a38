// Copyright (c) BoxMin contributors

#pragma once

#include <algorithm>
#include <cmath>

#include <Eigen/Core>

namespace boxmin {

/**
 * Returns the largest displacement of the step relative to the new iterate,
 * max |xᵢ − xᵢ_old| / max(|xᵢ|, 1).
 *
 * @param x The new iterate.
 * @param x_old The previous iterate.
 */
inline double relative_displacement(const Eigen::VectorXd& x,
                                    const Eigen::VectorXd& x_old) {
  return ((x - x_old).cwiseAbs().array() /
          x.cwiseAbs().array().max(1.0))
      .maxCoeff();
}

/**
 * Returns the relative gradient test of [4] section 7.2,
 * max |gᵢ| max(|dᵢ|, 1) / max(|f|, 1).
 *
 * @param g The gradient at the new iterate.
 * @param d The direction of the last step.
 * @param f The objective value at the new iterate.
 */
inline double relative_gradient(const Eigen::VectorXd& g,
                                const Eigen::VectorXd& d, double f) {
  return (g.cwiseAbs().array() * d.cwiseAbs().array().max(1.0)).maxCoeff() /
         std::max(std::abs(f), 1.0);
}

}  // namespace boxmin
