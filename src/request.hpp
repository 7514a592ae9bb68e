// SPDX-License-Identifier: MIT

// src/request.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wme_pipe {

/// Equality filter on one response field.
struct Filter {
    std::string field;
    std::string value;
};

/// Query payload for metadata and real-time endpoints.
///
/// Times are RFC 3339 strings as the server expects them, for example
/// "2024-05-01T00:00:00Z". Members left empty are not serialized.
struct Request {
    std::optional<std::string> since = {};
    std::vector<std::string> fields = {};
    std::vector<Filter> filters = {};
    std::optional<int64_t> limit = {};
    std::vector<int> parts = {};
    std::map<int, int64_t> offsets = {};               ///< partition -> next offset
    std::map<int, std::string> since_per_partition = {};

    bool Empty() const {
        return !since && fields.empty() && filters.empty() && !limit && parts.empty() &&
               offsets.empty() && since_per_partition.empty();
    }

    /// Serialize to a compact JSON object.
    std::string ToJson() const;
};

}  // namespace wme_pipe
