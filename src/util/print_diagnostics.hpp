// Copyright (c) BoxMin contributors

#pragma once

#include <stdint.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "boxmin/util/print.hpp"
#include "util/solve_profiler.hpp"

namespace boxmin {

/**
 * Iteration type.
 */
enum class IterationType : uint8_t {
  /// Line search step.
  NORMAL,
  /// Zero-length step that only pinned variables to their bounds.
  PINNED,
  /// Step after which fixed variables were released.
  RELEASED
};

/**
 * Converts std::chrono::duration to a number of milliseconds rounded to three
 * decimals.
 */
template <typename Rep, typename Period = std::ratio<1>>
constexpr double to_ms(const std::chrono::duration<Rep, Period>& duration) {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  return duration_cast<microseconds>(duration).count() / 1e3;
}

/**
 * Renders histogram of the given normalized value.
 *
 * @tparam Width Width of the histogram in characters.
 * @param value Normalized value from 0 to 1.
 */
template <int Width>
  requires(Width > 0)
inline std::string histogram(double value) {
  value = std::clamp(value, 0.0, 1.0);

  double ipart;
  int fpart = static_cast<int>(std::modf(value * Width, &ipart) * 8);

  constexpr std::string_view strs[] = {" ", "▏", "▎", "▍", "▌",
                                       "▋", "▊", "▉", "█"};
  std::string hist;

  int index = 0;
  while (index < ipart) {
    hist += strs[8];
    ++index;
  }
  if (fpart > 0) {
    hist += strs[fpart];
    ++index;
  }
  while (index < Width) {
    hist += strs[0];
    ++index;
  }

  return hist;
}

/**
 * Prints diagnostics for the current iteration.
 *
 * @param row Number of rows printed so far; a header precedes every 20th.
 * @param iterations Number of iterations.
 * @param type The iteration's type.
 * @param time The iteration duration.
 * @param f The objective value.
 * @param g_norm Infinity norm of the gradient over the free variables.
 * @param λ The accepted step length.
 * @param num_fixed Number of variables fixed at a bound.
 */
template <typename Rep, typename Period = std::ratio<1>>
void print_iteration_diagnostics(int row, int iterations, IterationType type,
                                 const std::chrono::duration<Rep, Period>& time,
                                 double f, double g_norm, double λ,
                                 int num_fixed) {
  if (row % 20 == 0) {
    if (row == 0) {
      boxmin::print("┏");
    } else {
      boxmin::print("┢");
    }
    boxmin::print(
        "{:━^7}┯{:━^6}┯{:━^11}┯{:━^15}┯{:━^12}┯{:━^12}┯{:━^7}",
        "", "", "", "", "", "", "");
    if (row == 0) {
      boxmin::println("┓");
    } else {
      boxmin::println("┪");
    }
    boxmin::println("┃{:^7}│{:^6}│{:^11}│{:^15}│{:^12}│{:^12}│{:^7}┃", "iter",
                    "type", "time (ms)", "f", "‖∇f‖_∞", "λ", "fixed");
    boxmin::println("┡{:━^7}┷{:━^6}┷{:━^11}┷{:━^15}┷{:━^12}┷{:━^12}┷{:━^7}┩",
                    "", "", "", "", "", "", "");
  }

  constexpr const char* kIterationTypeToString[] = {"norm", "pin", "free"};

  boxmin::println("│{:>6}  {:>5}  {:>10.3f}  {:>14e}  {:>11e}  {:>11e}  {:>5}  │",
                  iterations,
                  kIterationTypeToString[static_cast<uint8_t>(type)],
                  to_ms(time), f, g_norm, λ, num_fixed);
}

/**
 * Prints bottom of iteration diagnostics table.
 */
inline void print_bottom_iteration_diagnostics() {
  boxmin::println("└{:─^76}┘", "");
}

/**
 * Prints that a variable was pinned to one of its bounds.
 *
 * @param index The variable's index.
 * @param bound The bound it was pinned to.
 * @param previous_value The variable's value before it was pinned.
 */
inline void print_fixed_variable(int index, double bound,
                                 double previous_value) {
  boxmin::println("  ↳ fix x[{}] to bound {} from value {}", index, bound,
                  previous_value);
}

/**
 * Prints that a variable was released from its bound.
 *
 * @param index The variable's index.
 * @param bound The bound it was released from.
 * @param first_order First-order Lagrange multiplier estimate.
 * @param second_order Second-order Lagrange multiplier estimate.
 */
inline void print_released_variable(int index, double bound,
                                    double first_order, double second_order) {
  boxmin::println(
      "  ↳ free x[{}] from bound {} (Lagrange multiplier estimates {} | {})",
      index, bound, first_order, second_order);
}

/**
 * Prints that the BFGS update was skipped because ΔgᵀΔx wasn't sufficiently
 * positive.
 *
 * @param curvature ΔgᵀΔx over the free variables.
 * @param threshold The smallest accepted value.
 */
inline void print_skipped_update(double curvature, double threshold) {
  boxmin::println("  ↳ skip update (ΔgᵀΔx = {} < {})", curvature, threshold);
}

/**
 * Prints solver diagnostics.
 *
 * @param solve_profilers Solve profilers.
 */
inline void print_solver_diagnostics(
    std::span<const SolveProfiler> solve_profilers) {
  if (solve_profilers.empty()) {
    return;
  }

  auto solve_duration = to_ms(solve_profilers[0].total_duration());

  boxmin::println("┏{:━^23}┯{:━^18}┯{:━^10}┯{:━^9}┯{:━^4}┓", "", "", "", "",
                  "");
  boxmin::println("┃{:^23}│{:^18}│{:^10}│{:^9}│{:^4}┃", "trace", "percent",
                  "total (ms)", "each (ms)", "runs");
  boxmin::println("┡{:━^23}┷{:━^18}┷{:━^10}┷{:━^9}┷{:━^4}┩", "", "", "", "",
                  "");

  for (const auto& profiler : solve_profilers) {
    double norm = solve_duration == 0.0
                      ? (&profiler == &solve_profilers[0] ? 1.0 : 0.0)
                      : to_ms(profiler.total_duration()) / solve_duration;
    boxmin::println("│{:<23} {:>6.2f}%▕{}▏ {:>10.3f} {:>9.3f} {:>4}│",
                    profiler.name(), norm * 100.0, histogram<9>(norm),
                    to_ms(profiler.total_duration()),
                    to_ms(profiler.average_duration()), profiler.num_solves());
  }

  boxmin::println("└{:─^70}┘", "");
}

}  // namespace boxmin
