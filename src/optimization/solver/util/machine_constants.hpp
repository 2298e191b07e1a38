// Copyright (c) BoxMin contributors

#pragma once

#include <cmath>
#include <limits>

namespace boxmin {

/**
 * Floating-point thresholds shared by the solver components. Computed once per
 * solver instance instead of living in global state.
 */
struct MachineConstants {
  /// Machine epsilon; the smallest ε with 1 + ε > 1.
  double epsilon = std::numeric_limits<double>::epsilon();

  /// Values with magnitude at or below this are treated as zero (√ε).
  double zero = std::sqrt(std::numeric_limits<double>::epsilon());
};

}  // namespace boxmin
