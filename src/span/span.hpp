#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace span {

using SourceId = uint32_t;
constexpr SourceId kInvalidSourceId = std::numeric_limits<SourceId>::max();

// Half-open byte range [start, end) inside one registered source text.
struct Span {
    SourceId source = kInvalidSourceId;
    uint32_t start = 0;
    uint32_t end = 0;

    constexpr bool is_valid() const { return source != kInvalidSourceId; }
    constexpr uint32_t length() const { return end >= start ? end - start : 0; }
    constexpr bool contains(uint32_t offset) const { return offset >= start && offset < end; }

    static constexpr Span invalid() { return {}; }
};

struct LineCol {
    size_t line = 0;   // 1-based
    size_t column = 0; // 1-based
};

} // namespace span
