// Copyright (c) BoxMin contributors

#pragma once

#include <chrono>
#include <utility>

#include "util/solve_profiler.hpp"

namespace boxmin {

/**
 * Starts a profiler in the constructor and stops it in the destructor.
 */
class ScopedProfiler {
 public:
  /**
   * Starts a profiler.
   *
   * @param profiler The profiler.
   */
  explicit ScopedProfiler(SolveProfiler& profiler) noexcept
      : m_profiler{&profiler} {
    m_profiler->start();
  }

  /**
   * Stops a profiler.
   */
  ~ScopedProfiler() {
    if (m_active) {
      m_profiler->stop();
    }
  }

  ScopedProfiler(ScopedProfiler&& rhs) noexcept
      : m_profiler{std::move(rhs.m_profiler)}, m_active{rhs.m_active} {
    rhs.m_active = false;
  }

  ScopedProfiler(const ScopedProfiler&) = delete;
  ScopedProfiler& operator=(const ScopedProfiler&) = delete;

  /**
   * Stops the profiler.
   *
   * If this is called, the destructor is a no-op.
   */
  void stop() {
    if (m_active) {
      m_profiler->stop();
      m_active = false;
    }
  }

  /**
   * Returns the most recent solve duration in milliseconds as a double.
   */
  const std::chrono::duration<double>& current_duration() const {
    return m_profiler->current_duration();
  }

 private:
  SolveProfiler* m_profiler;
  bool m_active = true;
};

}  // namespace boxmin
