// SPDX-License-Identifier: MIT

// src/range_planner.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "src/resource.hpp"

namespace wme_pipe {

/// Partition [0, total_size) into contiguous ranges of `chunk_size` bytes; the
/// last range carries the remainder.
///
/// An unknown size yields one unbounded range (sequential fetch). A chunk
/// size of zero, or one at least as large as the resource, yields a single
/// bounded range. An empty resource yields no ranges.
std::vector<ByteRange> PlanRanges(std::optional<uint64_t> total_size, uint64_t chunk_size);

}  // namespace wme_pipe
