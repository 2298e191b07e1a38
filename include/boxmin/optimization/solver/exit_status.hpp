// Copyright (c) BoxMin contributors

#pragma once

#include <stdint.h>

#include <string_view>

#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * Solver exit status. Negative values indicate failure.
 */
enum class ExitStatus : int8_t {
  /// Found a minimizer; no fixed variable could be released.
  SUCCESS = 0,
  /// The solver returned its solution so far after the user requested a stop.
  CALLBACK_REQUESTED_STOP = 1,
  /// The solver options were out of range.
  INVALID_OPTIONS = -1,
  /// The bound arrays didn't match the problem size or had lower > upper.
  INVALID_BOUNDS = -2,
  /// The initial guess was outside the box or wasn't finite.
  INFEASIBLE_INITIAL_GUESS = -3,
  /// The objective or its gradient wasn't finite at the initial guess.
  NONFINITE_INITIAL_COST_OR_GRADIENT = -4,
  /// The search direction wasn't a descent direction (gᵀd > 0). Usually the
  /// supplied gradient is inconsistent with the objective.
  NONDESCENT_DIRECTION = -5,
  /// The line search produced a step length past the feasibility bound.
  INFEASIBLE_STEP_LENGTH = -6,
  /// A rank-one modification of the LDLᵀ factor produced NaN or ∞.
  NONFINITE_FACTORIZATION = -7,
  /// The search direction contained NaN or ∞.
  NONFINITE_DIRECTION = -8,
  /// A variable in the active set wasn't sitting on either of its bounds.
  INCONSISTENT_ACTIVE_SET = -9,
  /// The solver returned its solution so far after exceeding the maximum
  /// number of iterations.
  MAX_ITERATIONS_EXCEEDED = -10,
  /// The solver returned its solution so far after exceeding the maximum
  /// elapsed wall clock time.
  TIMEOUT = -11,
};

/**
 * Returns user-readable message corresponding to the exit status.
 *
 * @param exit_status Solver exit status.
 */
BOXMIN_DLLEXPORT constexpr std::string_view to_message(
    const ExitStatus& exit_status) {
  using enum ExitStatus;

  switch (exit_status) {
    case SUCCESS:
      return "success";
    case CALLBACK_REQUESTED_STOP:
      return "callback requested stop";
    case INVALID_OPTIONS:
      return "invalid solver options";
    case INVALID_BOUNDS:
      return "invalid bounds";
    case INFEASIBLE_INITIAL_GUESS:
      return "initial guess outside the bounds";
    case NONFINITE_INITIAL_COST_OR_GRADIENT:
      return "non-finite initial cost or gradient";
    case NONDESCENT_DIRECTION:
      return "search direction is not a descent direction";
    case INFEASIBLE_STEP_LENGTH:
      return "step length exceeded the feasibility bound";
    case NONFINITE_FACTORIZATION:
      return "non-finite Hessian factorization";
    case NONFINITE_DIRECTION:
      return "non-finite search direction";
    case INCONSISTENT_ACTIVE_SET:
      return "fixed variable not on a bound";
    case MAX_ITERATIONS_EXCEEDED:
      return "maximum iterations exceeded";
    case TIMEOUT:
      return "solution returned after timeout";
    default:
      return "unknown";
  }
}

/**
 * Returns true if the exit status is a fatal defect, i.e. the solve was
 * aborted because an internal invariant broke.
 *
 * @param exit_status Solver exit status.
 */
constexpr bool is_fatal(const ExitStatus& exit_status) {
  using enum ExitStatus;

  return exit_status == NONDESCENT_DIRECTION ||
         exit_status == INFEASIBLE_STEP_LENGTH ||
         exit_status == NONFINITE_FACTORIZATION ||
         exit_status == NONFINITE_DIRECTION ||
         exit_status == INCONSISTENT_ACTIVE_SET;
}

}  // namespace boxmin
