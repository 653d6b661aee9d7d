// include/ez/errors.hpp
#pragma once

#include "ez/grapheme_match.hpp"
#include "ez/pattern.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ez {

// Slice or element bounds outside [0, size()] after negative-index remapping
class IndexError : public std::out_of_range {
public:
    explicit IndexError(const std::string& message) : std::out_of_range(message) {}
};

// Malformed pattern expression; offset is in UTF-16 units of the expression
class PatternError : public std::invalid_argument {
public:
    PatternError(const std::string& message, int32_t offset)
        : std::invalid_argument(message), offset_(offset) {}

    int32_t offset() const noexcept { return offset_; }

private:
    int32_t offset_;
};

// A match whose indices do not reproduce its text in the given source
class MatchValidityError : public std::runtime_error {
public:
    MatchValidityError(const std::string& message,
                       GraphemeMatch match,
                       std::string actual,
                       std::vector<ByteSpan> byte_occurrences,
                       std::vector<GraphemeMatch> occurrences)
        : std::runtime_error(message),
          match_(std::move(match)),
          actual_(std::move(actual)),
          byte_occurrences_(std::move(byte_occurrences)),
          occurrences_(std::move(occurrences)) {}

    const GraphemeMatch& match() const noexcept { return match_; }
    const std::string& expected() const noexcept { return match_.as_str(); }
    const std::string& actual() const noexcept { return actual_; }

    // Where the matched text does occur in the source, in bytes and graphemes
    const std::vector<ByteSpan>& byte_occurrences() const noexcept { return byte_occurrences_; }
    const std::vector<GraphemeMatch>& occurrences() const noexcept { return occurrences_; }

private:
    GraphemeMatch match_;
    std::string actual_;
    std::vector<ByteSpan> byte_occurrences_;
    std::vector<GraphemeMatch> occurrences_;
};

} // namespace ez
