// include/ez/ez_string.hpp
#pragma once

#include "ez/core/once_cache.hpp"
#include "ez/grapheme.hpp"
#include "ez/pattern.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ez {

class GraphemeMatch;
class MatchRange;

// Locator entry: where a cluster starts in the raw text, and its index
struct ByteIndexEntry {
    size_t byte_offset;
    size_t grapheme_index;

    bool operator==(const ByteIndexEntry& other) const {
        return byte_offset == other.byte_offset && grapheme_index == other.grapheme_index;
    }
};

// Immutable UTF-8 string indexed by extended grapheme clusters.
//
// Segmentation and the byte-to-grapheme table are computed lazily, once,
// on first use. Copies share those caches since they derive only from the
// raw text.
class EzStr {
public:
    EzStr();
    EzStr(std::string data);
    EzStr(const char* data);
    explicit EzStr(char c);

    // No move operations: a moved-from string must keep usable caches
    EzStr(const EzStr& other) = default;
    EzStr& operator=(const EzStr& other) = default;

    const std::string& str() const noexcept { return data_; }
    size_t byte_size() const noexcept { return data_.size(); }

    // Grapheme count, not byte count
    size_t size() const;
    size_t length() const { return size(); }
    bool empty() const noexcept { return data_.empty(); }

    const std::vector<Grapheme>& graphemes() const;
    const std::vector<ByteIndexEntry>& byte_index() const;

    // True once the segmentation behind both caches has run
    bool segmented() const noexcept { return caches_->segmentation.ready(); }

    // Grapheme index for a byte offset. An offset inside a cluster resolves
    // to the next cluster; offsets past the last cluster start resolve to size().
    size_t grapheme_index_at(size_t byte_offset) const;

    const Grapheme& operator[](size_t index) const { return graphemes()[index]; }
    const Grapheme& at(size_t index) const;

    std::vector<Grapheme>::const_iterator begin() const { return graphemes().begin(); }
    std::vector<Grapheme>::const_iterator end() const { return graphemes().end(); }

    // Clusters [start, end). A negative index v is remapped to size() + v + 1,
    // so -1 means one past the last cluster. Out-of-range bounds after
    // remapping throw IndexError.
    EzStr slice(std::ptrdiff_t start, std::ptrdiff_t end) const;

    // Byte-level substring test; no grapheme translation
    bool contains(const std::string& substring) const;

    std::optional<GraphemeMatch> find(const Pattern& pattern) const;

    // Lazy view over all matches; this string and the pattern must outlive it
    MatchRange find_iter(const Pattern& pattern) const&;
    MatchRange find_iter(const Pattern& pattern) const&& = delete;
    MatchRange find_iter(const Pattern&& pattern) const& = delete;
    MatchRange find_iter(const Pattern&& pattern) const&& = delete;

    std::vector<GraphemeMatch> find_all(const Pattern& pattern) const;

    // Translates a byte match into grapheme indices and re-slices its text
    GraphemeMatch match_from_bytes(const ByteSpan& span) const;

    EzStr normalized() const;
    int to_int() const;

    std::string debug_string() const;

    bool operator==(const EzStr& other) const { return data_ == other.data_; }
    bool operator!=(const EzStr& other) const { return data_ != other.data_; }

private:
    // Both caches come from a single segmentation pass
    struct Segmentation {
        std::vector<Grapheme> graphemes;
        std::vector<ByteIndexEntry> byte_index;
    };

    struct Caches {
        OnceCache<Segmentation> segmentation;
    };

    const Segmentation& segmentation() const;

    std::string data_;
    std::shared_ptr<Caches> caches_;
};

EzStr operator+(const EzStr& lhs, const EzStr& rhs);
EzStr operator+(const EzStr& lhs, const std::string& rhs);
EzStr operator+(const EzStr& lhs, const char* rhs);

inline std::ostream& operator<<(std::ostream& os, const EzStr& str) {
    return os << str.str();
}

} // namespace ez

namespace std {

template <>
struct hash<ez::EzStr> {
    size_t operator()(const ez::EzStr& str) const noexcept {
        return std::hash<std::string>{}(str.str());
    }
};

} // namespace std
