// Copyright (c) BoxMin contributors

#pragma once

#include <cmath>
#include <string>

#include <Eigen/Core>
#include <fmt/core.h>

#include "optimization/solver/util/machine_constants.hpp"
#include "optimization/solver/util/triangular_solve.hpp"

// See docs/algorithms.md#Works_cited for citation definitions

namespace boxmin {

/**
 * Maintains the factorization B = LDLᵀ of a BFGS Hessian approximation under
 * rank-one modifications, where L is unit lower triangular and D is diagonal.
 *
 * Rows and columns of fixed variables don't take part in the modifications or
 * the solves; they're kept zeroed.
 */
class LDLTFactor {
 public:
  /**
   * Constructs an identity factorization.
   *
   * @param num_decision_variables The number of decision variables.
   * @param constants Machine constants.
   */
  explicit LDLTFactor(int num_decision_variables,
                      const MachineConstants& constants = MachineConstants{})
      : m_L{Eigen::MatrixXd::Identity(num_decision_variables,
                                      num_decision_variables)},
        m_D{Eigen::VectorXd::Ones(num_decision_variables)},
        m_LD{num_decision_variables, num_decision_variables},
        m_constants{constants} {}

  /**
   * Reports whether previous computation was successful.
   *
   * @return Whether previous computation was successful.
   */
  Eigen::ComputationInfo info() const { return m_info; }

  /**
   * Returns a description of the last failure, or an empty string.
   */
  const std::string& error_message() const { return m_error_message; }

  /**
   * Returns the unit lower triangular factor L.
   */
  const Eigen::MatrixXd& L() const { return m_L; }

  /**
   * Returns the diagonal of D.
   */
  const Eigen::VectorXd& D() const { return m_D; }

  /**
   * Returns LDLᵀ. The solver never forms the product; this is for tests.
   */
  Eigen::MatrixXd matrix() const {
    return m_L * m_D.asDiagonal() * m_L.transpose();
  }

  /**
   * Replaces the factors. Test helper for starting from a known
   * factorization; the solver always starts from the identity.
   *
   * @param L Unit lower triangular factor.
   * @param D Diagonal of D.
   */
  void set_factors(const Eigen::MatrixXd& L, const Eigen::VectorXd& D) {
    m_L = L;
    m_D = D;
    m_info = Eigen::Success;
    m_error_message.clear();
  }

  /**
   * Zeroes row and column i, including the diagonal. Called when variable i
   * joins the active set.
   *
   * @param i The variable index.
   */
  void remove(int i) {
    m_L.row(i).setZero();
    m_L.col(i).setZero();
    m_D[i] = 0.0;
  }

  /**
   * Resets row and column i to those of the identity. Called when variable i
   * leaves the active set.
   *
   * @param i The variable index.
   */
  void restore(int i) {
    remove(i);
    m_L(i, i) = 1.0;
    m_D[i] = 1.0;
  }

  /**
   * Computes the factors of LDLᵀ + cvvᵀ restricted to the free variables.
   *
   * Uses method C1 of [2] for c > 0 and method C2 of [2] for c < 0. Rows and
   * columns of fixed variables are zeroed afterwards.
   *
   * Sets info() to Eigen::NumericalIssue if an updated entry of D is NaN or ∞.
   *
   * @param v The update vector.
   * @param c The update coefficient.
   * @param is_fixed Which variables are fixed.
   * @return The factorization.
   */
  LDLTFactor& rank_one_update(const Eigen::VectorXd& v, double c,
                              const Eigen::ArrayX<bool>& is_fixed) {
    m_info = Eigen::Success;
    m_error_message.clear();

    if (c == 0.0) {
      return *this;
    }

    const int n = m_D.rows();

    // Index of the last free variable; the final column of the sweep needs no
    // safeguards since nothing depends on its running scalars
    int last_free = -1;
    for (int j = n - 1; j >= 0; --j) {
      if (!is_fixed[j]) {
        last_free = j;
        break;
      }
    }
    if (last_free == -1) {
      return *this;
    }

    Eigen::VectorXd w = (!is_fixed).select(v, 0.0);

    if (c > 0.0) {
      // Method C1
      double t = c;
      for (int j = 0; j < n; ++j) {
        if (is_fixed[j]) {
          continue;
        }

        double p = w[j];
        double d = m_D[j];
        double d_bar = d + t * p * p;
        m_D[j] = d_bar;

        if (!std::isfinite(m_D[j])) {
          m_info = Eigen::NumericalIssue;
          m_error_message = fmt::format(
              "D[{}] = {} after increase (w[{}]={}, d={}, t={}, c={})", j,
              m_D[j], j, p, d, t, c);
          return *this;
        }

        double β = p * t / d_bar;
        t *= d / d_bar;
        for (int r = j + 1; r < n; ++r) {
          if (!is_fixed[r]) {
            w[r] -= p * m_L(r, j);
            m_L(r, j) += β * w[r];
          }
        }
      }
    } else {
      // Method C2. Solve Lp = v first, then t = 1 + c Σ pᵢ²/dᵢ.
      Eigen::VectorXd P = solve_triangular<Eigen::Lower>(m_L, w, is_fixed);

      double t = 0.0;
      for (int i = 0; i < n; ++i) {
        if (!is_fixed[i]) {
          t += P[i] * P[i] / m_D[i];
        }
      }

      // Rounding can make the updated matrix look indefinite
      double sqrt_t = 1.0 + c * t;
      sqrt_t = sqrt_t < 0.0 ? 0.0 : std::sqrt(sqrt_t);

      double α = c;
      double σ = c / (1.0 + sqrt_t);

      for (int j = 0; j < n; ++j) {
        if (is_fixed[j]) {
          continue;
        }

        double d = m_D[j];
        double p = P[j] * P[j] / d;
        double θ = 1.0 + σ * p;
        t -= p;
        if (t < 0.0) {
          t = 0.0;
        }

        double plus = σ * σ * p * t;
        if (j < last_free && plus <= m_constants.zero) {
          plus = m_constants.zero;
        }
        double ρ = θ * θ + plus;
        m_D[j] = ρ * d;

        if (!std::isfinite(m_D[j])) {
          m_info = Eigen::NumericalIssue;
          m_error_message = fmt::format(
              "D[{}] = {} after decrease (P[{}]={}, d={}, t={}, p={}, σ={}, "
              "c={})",
              j, m_D[j], j, P[j], d, t, p, σ, c);
          return *this;
        }

        double β = α * P[j] / (ρ * d);
        α /= ρ;
        ρ = std::sqrt(ρ);
        double σ_old = σ;
        σ *= (1.0 + ρ) / (ρ * (θ + ρ));
        if (j < last_free && !std::isfinite(σ)) {
          m_info = Eigen::NumericalIssue;
          m_error_message = fmt::format(
              "σ is not finite at column {} (ρ={}, θ={}, P[{}]={}, p={}, d={}, "
              "t={}, previous σ={})",
              j, ρ, θ, j, P[j], p, d, t, σ_old);
          return *this;
        }

        for (int r = j + 1; r < n; ++r) {
          if (!is_fixed[r]) {
            w[r] -= P[j] * m_L(r, j);
            m_L(r, j) += β * w[r];
          }
        }
      }
    }

    for (int j = 0; j < n; ++j) {
      if (is_fixed[j]) {
        remove(j);
      }
    }

    return *this;
  }

  /**
   * Solves LDLᵀx = b over the free variables with a forward substitution on
   * LD followed by a back substitution on Lᵀ. Entries of fixed variables are
   * zero in the result.
   *
   * Sets info() to Eigen::NumericalIssue if either substitution produces NaN
   * or ∞.
   *
   * @param b Right-hand side.
   * @param is_fixed Which variables are fixed.
   * @return The solution.
   */
  Eigen::VectorXd solve(const Eigen::VectorXd& b,
                        const Eigen::ArrayX<bool>& is_fixed) {
    m_info = Eigen::Success;
    m_error_message.clear();

    const int n = m_D.rows();

    // LD keeps only the free block
    for (int k = 0; k < n; ++k) {
      for (int j = k; j < n; ++j) {
        m_LD(j, k) =
            (is_fixed[j] || is_fixed[k]) ? 0.0 : m_L(j, k) * m_D[k];
      }
    }

    // Solve (LD)y = b, where y = Lᵀx
    Eigen::VectorXd y =
        solve_triangular<Eigen::Lower>(m_LD, (!is_fixed).select(b, 0.0),
                                       is_fixed);
    for (int i = 0; i < n; ++i) {
      if (!std::isfinite(y[i])) {
        m_info = Eigen::NumericalIssue;
        m_error_message =
            fmt::format("(Lᵀx)[{}] = {} (b={}, fixed={}, D={})", i, y[i], b[i],
                        static_cast<bool>(is_fixed[i]), m_D[i]);
        return y;
      }
    }

    // Solve Lᵀx = y
    Eigen::VectorXd x =
        solve_triangular<Eigen::Upper>(m_L.transpose(), y, is_fixed);
    for (int i = 0; i < n; ++i) {
      if (!std::isfinite(x[i])) {
        m_info = Eigen::NumericalIssue;
        m_error_message = fmt::format("x[{}] = {} (y={}, D={})", i, x[i],
                                      y[i], m_D[i]);
        return x;
      }
    }

    return x;
  }

 private:
  /// Unit lower triangular factor.
  Eigen::MatrixXd m_L;

  /// Diagonal of D.
  Eigen::VectorXd m_D;

  /// Scratch storage for LD so solves don't allocate it every iteration.
  Eigen::MatrixXd m_LD;

  MachineConstants m_constants;

  Eigen::ComputationInfo m_info = Eigen::Success;

  std::string m_error_message;
};

}  // namespace boxmin
