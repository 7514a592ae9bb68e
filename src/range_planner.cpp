// SPDX-License-Identifier: MIT

// src/range_planner.cpp
#include "src/range_planner.hpp"

#include <algorithm>

namespace wme_pipe {

std::vector<ByteRange> PlanRanges(std::optional<uint64_t> total_size, uint64_t chunk_size) {
    if (!total_size) return {ByteRange{0, std::nullopt}};

    uint64_t size = *total_size;
    if (size == 0) return {};
    if (chunk_size == 0 || chunk_size >= size) return {ByteRange{0, size - 1}};

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<size_t>((size + chunk_size - 1) / chunk_size));
    for (uint64_t start = 0; start < size; start += chunk_size) {
        uint64_t end = std::min(start + chunk_size, size) - 1;
        ranges.push_back(ByteRange{start, end});
    }
    return ranges;
}

}  // namespace wme_pipe
