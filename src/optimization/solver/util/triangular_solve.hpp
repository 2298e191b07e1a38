// Copyright (c) BoxMin contributors

#pragma once

#include <Eigen/Core>

namespace boxmin {

/**
 * Solves Tx = b by substitution where T is triangular, ignoring the rows and
 * columns marked in skip.
 *
 * Skipped entries of x are set to zero and the corresponding diagonal entries
 * of T are never read, so they may be zero. Only the triangle selected by Mode
 * is read. NaN or ∞ in the result isn't checked here.
 *
 * @tparam Mode Eigen::Lower for forward substitution or Eigen::Upper for back
 *   substitution.
 * @param T Triangular matrix; pass L.transpose() to solve Lᵀx = b with a lower
 *   triangular L.
 * @param b Right-hand side.
 * @param skip Rows to leave out of the system, or an empty array to use every
 *   row.
 * @return The solution x.
 */
template <int Mode, typename Derived>
  requires(Mode == Eigen::Lower || Mode == Eigen::Upper)
Eigen::VectorXd solve_triangular(const Eigen::MatrixBase<Derived>& T,
                                 const Eigen::Ref<const Eigen::VectorXd>& b,
                                 const Eigen::ArrayX<bool>& skip) {
  const Eigen::Index n = b.rows();
  const bool use_mask = skip.rows() == n;

  auto skipped = [&](Eigen::Index i) { return use_mask && skip[i]; };

  Eigen::VectorXd x{n};

  if constexpr (Mode == Eigen::Lower) {
    for (Eigen::Index j = 0; j < n; ++j) {
      if (skipped(j)) {
        x[j] = 0.0;
        continue;
      }

      // xⱼ = (bⱼ − Σₖ<ⱼ Tⱼₖxₖ) / Tⱼⱼ
      double numerator = b[j];
      for (Eigen::Index k = 0; k < j; ++k) {
        if (!skipped(k)) {
          numerator -= T(j, k) * x[k];
        }
      }
      x[j] = numerator / T(j, j);
    }
  } else {
    for (Eigen::Index j = n - 1; j >= 0; --j) {
      if (skipped(j)) {
        x[j] = 0.0;
        continue;
      }

      // xⱼ = (bⱼ − Σₖ>ⱼ Tⱼₖxₖ) / Tⱼⱼ
      double numerator = b[j];
      for (Eigen::Index k = j + 1; k < n; ++k) {
        if (!skipped(k)) {
          numerator -= T(j, k) * x[k];
        }
      }
      x[j] = numerator / T(j, j);
    }
  }

  return x;
}

/**
 * Solves Tx = b by substitution where T is triangular.
 *
 * @tparam Mode Eigen::Lower for forward substitution or Eigen::Upper for back
 *   substitution.
 * @param T Triangular matrix.
 * @param b Right-hand side.
 * @return The solution x.
 */
template <int Mode, typename Derived>
  requires(Mode == Eigen::Lower || Mode == Eigen::Upper)
Eigen::VectorXd solve_triangular(const Eigen::MatrixBase<Derived>& T,
                                 const Eigen::Ref<const Eigen::VectorXd>& b) {
  return solve_triangular<Mode>(T, b, Eigen::ArrayX<bool>{});
}

}  // namespace boxmin
