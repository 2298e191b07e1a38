// Copyright (c) BoxMin contributors

#pragma once

#include <gch/small_vector.hpp>

namespace boxmin {

/**
 * Vector with inline storage for a handful of elements. Index lists in the
 * solver (fixed variables, release candidates) are usually short, so this
 * avoids heap traffic during iteration.
 */
template <typename T>
using small_vector = gch::small_vector<T>;

}  // namespace boxmin
