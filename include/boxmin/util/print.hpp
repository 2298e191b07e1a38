// Copyright (c) BoxMin contributors

#pragma once

#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace boxmin {

/**
 * Wrapper around fmt::print() that squelches write failure exceptions.
 */
template <typename... T>
inline void print(fmt::format_string<T...> fmt, T&&... args) {
  try {
    fmt::print(fmt, std::forward<T>(args)...);
  } catch (const std::system_error&) {
  }
}

/**
 * Wrapper around fmt::print() that appends a newline and squelches write
 * failure exceptions.
 */
template <typename... T>
inline void println(fmt::format_string<T...> fmt, T&&... args) {
  try {
    fmt::print("{}\n", fmt::format(fmt, std::forward<T>(args)...));
  } catch (const std::system_error&) {
  }
}

}  // namespace boxmin
