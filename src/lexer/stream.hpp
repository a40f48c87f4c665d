#pragma once

#include <cstdint>
#include <string>
#include <string_view>

struct Position {
    uint32_t offset = 0; // 0-based byte offset into the input

    std::string toString() const {
        return "offset " + std::to_string(offset);
    }
};

// Character cursor over an in-memory input. The input must outlive the stream.
class PositionedStream {
    std::string_view input;
    Position currentPos;

public:
    explicit PositionedStream(std::string_view text) : input(text) {}

    char peek(size_t offset = 0) const {
        size_t index = currentPos.offset + offset;
        return index < input.size() ? input[index] : '\0';
    }
    void advance(size_t n = 1) {
        for (size_t i = 0; i < n && !eof(); ++i) {
            currentPos.offset++;
        }
    }
    char get() {
        char c = peek();
        advance(1);
        return c;
    }
    bool eof(size_t n = 0) const {
        return currentPos.offset + n >= input.size();
    }
    const Position& getPosition() const {
        return currentPos;
    }
};
