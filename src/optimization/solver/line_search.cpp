// Copyright (c) BoxMin contributors

#include "optimization/solver/line_search.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Core>
#include <fmt/core.h>

#include "boxmin/util/eigen_formatter.hpp"
#include "util/print_diagnostics.hpp"

// See docs/algorithms.md#Works_cited for citation definitions

namespace boxmin {

ExitStatus LineSearch::search(const Eigen::VectorXd& x_old, double f_old,
                              const Eigen::VectorXd& g_old,
                              Eigen::VectorXd& d, double max_step,
                              WorkingSet& working_set, Eigen::VectorXd& x,
                              double& f) {
  constexpr double inf = std::numeric_limits<double>::infinity();

  const int n = x_old.rows();
  const double ε = m_constants.epsilon;
  const double zero = m_constants.zero;
  const double c_1 = m_options.sufficient_decrease;
  const double c_2 = m_options.curvature;

  m_message.clear();
  m_λ = 0.0;
  m_has_gradient = false;

  x = x_old;
  f = f_old;

  // Free variables at entry; variables pinned by a zero step leave this set
  // only after the search returns
  const Eigen::ArrayX<bool> is_free = !working_set.is_fixed();

  // Scale the step if it's too long
  double norm = is_free.select(d, 0.0).norm();
  double max_λ = 1.0;
  if (norm > max_step) {
    d = is_free.select(d * (max_step / norm), d);
  } else {
    max_λ = norm > 0.0 ? max_step / norm : inf;
  }

  // gᵀd over the free variables
  m_slope = is_free.select(g_old.cwiseProduct(d), 0.0).sum();

  if (std::abs(m_slope) <= zero) {
    m_step_type = StepType::STATIONARY;
    return ExitStatus::SUCCESS;
  }

  if (m_slope > zero) {
    m_message = fmt::format("gᵀd = {} > 0 with g = {:sfl}, d = {:sfl}",
                            m_slope, g_old, d);
    return ExitStatus::NONDESCENT_DIRECTION;
  }

  // Largest relative displacement of a full step
  double test = 0.0;
  for (int i = 0; i < n; ++i) {
    if (is_free[i]) {
      test = std::max(test, std::abs(d[i]) / std::max(std::abs(x_old[i]), 1.0));
    }
  }

  if (test <= zero) {
    m_step_type = StepType::STATIONARY;
    return ExitStatus::SUCCESS;
  }

  const double λ_min = m_options.displacement_tolerance / test;

  // Feasibility bound α: the longest step before a free variable reaches one
  // of the bounds not in the working set
  double α = inf;
  int bound_index = -1;
  const Eigen::VectorXd& lower = working_set.lower();
  const Eigen::VectorXd& upper = working_set.upper();
  for (int i = 0; i < n; ++i) {
    if (!is_free[i]) {
      continue;
    }

    if (d[i] < -ε && std::isfinite(lower[i])) {
      double α_i = (lower[i] - x_old[i]) / d[i];
      if (α_i <= zero) {
        x[i] = working_set.fix_to_lower(i);
        if (m_options.diagnostics) {
          print_fixed_variable(i, x[i], x_old[i]);
        }
        α = 0.0;
      } else if (α > α_i) {
        α = α_i;
        bound_index = i;
      }
    } else if (d[i] > ε && std::isfinite(upper[i])) {
      double α_i = (upper[i] - x_old[i]) / d[i];
      if (α_i <= zero) {
        x[i] = working_set.fix_to_upper(i);
        if (m_options.diagnostics) {
          print_fixed_variable(i, x[i], x_old[i]);
        }
        α = 0.0;
      } else if (α > α_i) {
        α = α_i;
        bound_index = i;
      }
    }
  }

  if (α <= zero) {
    m_step_type = StepType::ZERO_STEP;
    return ExitStatus::SUCCESS;
  }

  // x = x_old + λd, clipped to the box over the free variables
  auto step_to = [&](double λ) {
    m_has_gradient = false;
    for (int i = 0; i < n; ++i) {
      if (is_free[i]) {
        x[i] = std::clamp(x_old[i] + λ * d[i], lower[i], upper[i]);
      }
    }
  };

  // ∇f(x)ᵀd over the free variables
  auto slope_at = [&] {
    m_g_x = m_g(x);
    m_has_gradient = true;
    return is_free.select(m_g_x.cwiseProduct(d), 0.0).sum();
  };

  // f(x) ≤ f(x_old) + c₁λgᵀd
  auto sufficient_decrease = [&](double λ, double f_λ) {
    return f_λ <= f_old + c_1 * λ * m_slope;
  };

  // Accepts the step at λ, fixing the variable that bounded it if the step
  // reached its bound
  auto accept = [&](double λ) {
    m_λ = λ;
    m_step_type = StepType::NORMAL;
    if (bound_index != -1 && λ >= α) {
      const double x_bound = d[bound_index] > 0.0
                                 ? working_set.fix_to_upper(bound_index)
                                 : working_set.fix_to_lower(bound_index);
      if (x[bound_index] != x_bound) {
        x[bound_index] = x_bound;
        m_has_gradient = false;
      }
      if (m_options.diagnostics) {
        print_fixed_variable(bound_index, x[bound_index], x_old[bound_index]);
      }
    }
    return ExitStatus::SUCCESS;
  };

  auto revert = [&] {
    m_has_gradient = false;
    x = x_old;
    f = f_old;
    m_step_type = StepType::NO_PROGRESS;
    return ExitStatus::SUCCESS;
  };

  double λ = std::min(1.0, α);

  // Previous trial for cubic interpolation
  double λ_prev = 0.0;
  double f_prev = f_old;

  // Best trial so far, accepted if the step gets too short
  double best_f = inf;
  double best_λ = 0.0;

  // Bracket [λ_lo, λ_lo + Δλ] whose left end satisfies the sufficient
  // decrease condition and whose right end doesn't
  double λ_lo = 0.0;
  double f_lo = 0.0;
  double slope_lo = 0.0;
  double f_hi = 0.0;

  for (int k = 0;; ++k) {
    step_to(λ);
    f = m_f(x);

    // Shorten the step until f is defined
    while (!std::isfinite(f)) {
      λ *= 0.5;
      if (λ <= ε) {
        return revert();
      }
      step_to(λ);
      f = m_f(x);
    }

    if (f < best_f) {
      best_f = f;
      best_λ = λ;
    }

    if (sufficient_decrease(λ, f)) {
      double slope = slope_at();
      if (slope >= c_2 * m_slope) {
        return accept(λ);
      }

      if (k == 0) {
        // The first step is too short; extrapolate until the curvature
        // condition holds or sufficient decrease fails
        const double λ_max = std::min(α, max_λ);
        λ_lo = λ;
        f_lo = f;
        slope_lo = slope;
        while (λ < λ_max) {
          λ = std::min(2.0 * λ, λ_max);
          step_to(λ);
          f = m_f(x);
          if (!sufficient_decrease(λ, f)) {
            break;
          }

          slope = slope_at();
          if (slope >= c_2 * m_slope) {
            return accept(λ);
          }

          λ_lo = λ;
          f_lo = f;
          slope_lo = slope;
        }
        f_hi = f;
      } else {
        // The previous, longer trial failed sufficient decrease
        f_hi = f_prev;
        λ_lo = λ;
        f_lo = f;
        slope_lo = slope;
        λ = λ_prev;
      }
      break;
    } else if (λ < λ_min) {
      if (best_f < f_old) {
        step_to(best_λ);
        f = best_f;
        return accept(best_λ);
      }
      return revert();
    }

    // Backtrack by minimizing an interpolant of f along d
    double λ_next;
    if (k == 0) {
      // Quadratic through f(0), f'(0) and f(λ)
      λ_next = -0.5 * λ * m_slope / ((f - f_old) / λ - m_slope);
    } else {
      // Cubic through f(0), f'(0), f(λ) and f(λ_prev)
      double r_1 = f - f_old - λ * m_slope;
      double r_2 = f_prev - f_old - λ_prev * m_slope;
      double a = (r_1 / (λ * λ) - r_2 / (λ_prev * λ_prev)) / (λ - λ_prev);
      double b = (-λ_prev * r_1 / (λ * λ) + λ * r_2 / (λ_prev * λ_prev)) /
                 (λ - λ_prev);
      if (a == 0.0) {
        λ_next = -m_slope / (2.0 * b);
      } else {
        double disc = std::max(b * b - 3.0 * a * m_slope, 0.0);
        λ_next = (-b + std::sqrt(disc)) / (3.0 * a);
      }
    }

    // Keep the new trial within [0.1λ, 0.5λ]
    if (!(λ_next <= 0.5 * λ)) {
      λ_next = 0.5 * λ;
    }
    λ_prev = λ;
    f_prev = f;
    λ = std::max(λ_next, 0.1 * λ);

    if (λ > α) {
      m_message = fmt::format(
          "λ = {} exceeds the feasibility bound α = {} (bounding index {})", λ,
          α, bound_index);
      return ExitStatus::INFEASIBLE_STEP_LENGTH;
    }
  }

  // Refine within the bracket until the curvature condition holds
  double Δλ = λ - λ_lo;
  while (Δλ >= λ_min) {
    // Minimizer of the quadratic through f(λ_lo), f'(λ_lo) and f(λ_lo + Δλ),
    // kept within [0.2Δλ, 0.8Δλ]
    double λ_incr =
        -0.5 * slope_lo * Δλ * Δλ / (f_hi - f_lo - slope_lo * Δλ);
    if (!(λ_incr >= 0.2 * Δλ)) {
      λ_incr = 0.2 * Δλ;
    }
    λ_incr = std::min(λ_incr, 0.8 * Δλ);

    λ = λ_lo + λ_incr;
    step_to(λ);
    f = m_f(x);

    if (!sufficient_decrease(λ, f)) {
      Δλ = λ_incr;
      f_hi = f;
    } else {
      double slope = slope_at();
      if (slope >= c_2 * m_slope) {
        return accept(λ);
      }
      λ_lo = λ;
      Δλ -= λ_incr;
      f_lo = f;
      slope_lo = slope;
    }
  }

  // The bracket collapsed; its left end still satisfies sufficient decrease
  step_to(λ_lo);
  f = f_lo;
  return accept(λ_lo);
}

}  // namespace boxmin
