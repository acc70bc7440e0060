// SPDX-License-Identifier: MIT
// Neighbor lookup for ids that end in a number, e.g. "viewport-3"

#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace vp_stream {
namespace internal {

/// Ids whose numeric suffix differs by one: "vp-3" -> {"vp-2", "vp-4"}.
/// Zero padding is kept ("vp-07" -> {"vp-06", "vp-08"}); no negative neighbor
/// is produced. Empty for ids without a numeric suffix.
inline std::vector<std::string> adjacentIds(const std::string& id) {
    std::vector<std::string> out;
    size_t start = id.size();
    while (start > 0 && std::isdigit(static_cast<unsigned char>(id[start - 1]))) {
        --start;
    }
    size_t width = id.size() - start;
    // Suffixes past 18 digits would overflow
    if (width == 0 || width > 18) {
        return out;
    }

    const std::string prefix = id.substr(0, start);
    uint64_t value = std::stoull(id.substr(start));
    bool padded = width > 1 && id[start] == '0';

    auto format = [&](uint64_t n) {
        std::string digits = std::to_string(n);
        if (padded && digits.size() < width) {
            digits.insert(0, width - digits.size(), '0');
        }
        return prefix + digits;
    };

    if (value > 0) {
        out.push_back(format(value - 1));
    }
    out.push_back(format(value + 1));
    return out;
}

} // namespace internal
} // namespace vp_stream
