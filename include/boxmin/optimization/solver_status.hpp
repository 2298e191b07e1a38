// Copyright (c) BoxMin contributors

#pragma once

#include <string>

#include "boxmin/optimization/solver/exit_status.hpp"
#include "boxmin/util/small_vector.hpp"
#include "boxmin/util/symbol_exports.hpp"

namespace boxmin {

/**
 * Return value of a solve containing the exit status, the solution's cost and
 * the active set at exit.
 */
struct BOXMIN_DLLEXPORT SolverStatus {
  /// The solver's exit status.
  ExitStatus exit_status = ExitStatus::SUCCESS;

  /// The objective value at the returned point.
  double cost = 0.0;

  /// Number of iterations charged against Options::max_iterations.
  int iterations = 0;

  /// Indices of the variables fixed at one of their bounds when the solver
  /// returned, in the order they were fixed.
  small_vector<int> active_set;

  /// Context for fatal exit statuses (offending index and values); empty
  /// otherwise.
  std::string message;
};

}  // namespace boxmin
