//# Unicode Utilities Header File

#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace ez::unicode {

// Unicode character representation
struct CodePoint {
    uint32_t value;
    std::string utf8;  // UTF-8 representation
};

// One extended grapheme cluster and the byte offset it starts at
struct GraphemeBoundary {
    size_t byte_offset;
    std::string text;
};

// Split UTF-8 text into extended grapheme clusters (root locale)
std::vector<GraphemeBoundary> segment_graphemes(const std::string& text);

// Normalize Unicode text (NFC normalization)
std::string normalize(const std::string& text);

// Split text into Unicode code points
std::vector<CodePoint> to_code_points(const std::string& text);

// Number of code points, counting each ill-formed byte as one
size_t code_point_count(const std::string& text);

// True when every byte belongs to a well-formed UTF-8 sequence
bool is_valid_utf8(const std::string& text);

// Double-quoted, escaped rendering for diagnostics
std::string quote(const std::string& text);

} // namespace ez::unicode
