// include/ez/grapheme_match.hpp
#pragma once

#include "ez/ez_string.hpp"
#include "ez/pattern.hpp"
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace ez {

// A match expressed in grapheme indices [start, end) together with an owned
// copy of the matched text. Consistency with a source string is not checked
// on construction; call is_valid() or ensure_valid() for that.
class GraphemeMatch {
public:
    GraphemeMatch();
    GraphemeMatch(size_t start, size_t end, EzStr text);

    size_t start() const { return start_; }
    size_t end() const { return end_; }
    size_t length() const { return end_ - start_; }

    const EzStr& text() const { return text_; }
    const std::string& as_str() const { return text_.str(); }
    EzStr to_ezstr() const { return text_; }

    // Re-slices source at [start, end) and compares with the stored text
    bool is_valid(const EzStr& source) const;

    // Same check, throwing MatchValidityError with diagnostics on failure
    void ensure_valid(const EzStr& source) const;

    std::string debug_string() const;

    bool operator==(const GraphemeMatch& other) const {
        return start_ == other.start_ && end_ == other.end_ && text_ == other.text_;
    }
    bool operator!=(const GraphemeMatch& other) const { return !(*this == other); }

private:
    size_t start_;
    size_t end_;
    EzStr text_;
};

inline std::ostream& operator<<(std::ostream& os, const GraphemeMatch& match) {
    return os << match.as_str();
}

// Input iterator translating each pattern match as it is reached.
// Copies share one scanner.
class MatchIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = GraphemeMatch;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = GraphemeMatch;

    MatchIterator() = default;
    MatchIterator(const EzStr* source, std::shared_ptr<Pattern::Scanner> scanner)
        : source_(source), scanner_(std::move(scanner)) {
        advance();
    }

    GraphemeMatch operator*() const {
        return source_->match_from_bytes(*current_);
    }

    MatchIterator& operator++() {
        advance();
        return *this;
    }

    MatchIterator operator++(int) {
        MatchIterator previous = *this;
        advance();
        return previous;
    }

    bool operator==(const MatchIterator& other) const {
        return scanner_ == other.scanner_ && current_ == other.current_;
    }
    bool operator!=(const MatchIterator& other) const { return !(*this == other); }

private:
    void advance() {
        current_ = scanner_ ? scanner_->next() : std::nullopt;
        if (!current_) {
            scanner_.reset();
        }
    }

    const EzStr* source_ = nullptr;
    std::shared_ptr<Pattern::Scanner> scanner_;
    std::optional<ByteSpan> current_;
};

// Restartable view over all matches of a pattern in a string.
// Each call to begin() searches from the start of the text again.
class MatchRange {
public:
    MatchRange(const EzStr& source, const Pattern& pattern)
        : source_(&source), pattern_(&pattern) {}

    MatchIterator begin() const {
        return MatchIterator(source_, std::make_shared<Pattern::Scanner>(pattern_->scan(source_->str())));
    }

    MatchIterator end() const { return MatchIterator(); }

private:
    const EzStr* source_;
    const Pattern* pattern_;
};

} // namespace ez

namespace std {

template <>
struct hash<ez::GraphemeMatch> {
    size_t operator()(const ez::GraphemeMatch& match) const noexcept {
        size_t seed = std::hash<ez::EzStr>{}(match.text());
        seed ^= match.start() + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= match.end() + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace std
