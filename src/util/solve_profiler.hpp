// Copyright (c) BoxMin contributors

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace boxmin {

/**
 * Records the number of profiler measurements (start/stop pairs) and the
 * average duration between each start and stop call.
 */
class SolveProfiler {
 public:
  /**
   * Constructs a SolveProfiler.
   *
   * @param name Name of measurement to show in diagnostics.
   */
  explicit SolveProfiler(std::string_view name = "solve") : m_name{name} {}

  /**
   * Tell the profiler to start measuring solve time.
   */
  void start() { m_current_solve_start_time = std::chrono::steady_clock::now(); }

  /**
   * Tell the profiler to stop measuring solve time, increment the number of
   * averages, and incorporate the latest measurement into the average.
   */
  void stop() {
    m_current_solve_duration =
        std::chrono::steady_clock::now() - m_current_solve_start_time;
    m_total_solve_duration += m_current_solve_duration;
    ++m_num_solves;
  }

  /**
   * Returns name of measurement to show in diagnostics.
   */
  const std::string& name() const { return m_name; }

  /**
   * Returns the number of solves.
   */
  int num_solves() const { return m_num_solves; }

  /**
   * Returns the most recent solve duration.
   */
  const std::chrono::duration<double>& current_duration() const {
    return m_current_solve_duration;
  }

  /**
   * Returns the average solve duration.
   */
  std::chrono::duration<double> average_duration() const {
    if (m_num_solves == 0) {
      return std::chrono::duration<double>{0.0};
    } else {
      return m_total_solve_duration / m_num_solves;
    }
  }

  /**
   * Returns the sum of all solve durations.
   */
  const std::chrono::duration<double>& total_duration() const {
    return m_total_solve_duration;
  }

 private:
  std::string m_name;

  std::chrono::steady_clock::time_point m_current_solve_start_time;
  std::chrono::duration<double> m_current_solve_duration{0.0};
  std::chrono::duration<double> m_total_solve_duration{0.0};

  int m_num_solves = 0;
};

}  // namespace boxmin
