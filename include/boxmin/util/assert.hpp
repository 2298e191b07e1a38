// Copyright (c) BoxMin contributors

#pragma once

#include <source_location>
#include <stdexcept>

#include <fmt/core.h>

/**
 * Throw an exception if the given condition is false.
 *
 * Used for programming errors such as callbacks returning vectors of the wrong
 * size; numerical failures are reported through ExitStatus instead.
 */
#define boxmin_assert(condition)                                            \
  do {                                                                      \
    if (!(condition)) {                                                     \
      auto location = std::source_location::current();                      \
      throw std::invalid_argument(fmt::format(                              \
          "{}:{}: {}: Assertion `{}' failed.", location.file_name(),        \
          location.line(), location.function_name(), #condition));          \
    }                                                                       \
  } while (0)
