// include/ez/grapheme.hpp
#pragma once

#include <string>
#include <ostream>

namespace ez {

// A single user-perceived character: one extended grapheme cluster
struct Grapheme {
    std::string value;

    Grapheme() = default;
    explicit Grapheme(std::string text) : value(std::move(text)) {}

    bool operator==(const Grapheme& other) const { return value == other.value; }
    bool operator!=(const Grapheme& other) const { return value != other.value; }
};

inline std::ostream& operator<<(std::ostream& os, const Grapheme& grapheme) {
    return os << grapheme.value;
}

} // namespace ez
