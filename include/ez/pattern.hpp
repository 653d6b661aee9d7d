// include/ez/pattern.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ez {

// Half-open range of byte offsets into raw text
struct ByteSpan {
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }

    bool operator==(const ByteSpan& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteSpan& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const ByteSpan& span) {
    return os << "[" << span.start << ".." << span.end << ")";
}

// Backslash-escapes every regex metacharacter in text
std::string escape(const std::string& text);

// Compiled pattern searched over UTF-8 text one code point at a time.
// Offsets it reports are byte offsets; grapheme translation happens in EzStr.
class Pattern {
public:
    // Incremental left-to-right search over one text.
    // The text must outlive the scanner.
    class Scanner {
    public:
        Scanner(Scanner&& other) noexcept;
        Scanner& operator=(Scanner&& other) noexcept;
        ~Scanner();

        // Next non-overlapping match, or nullopt once the text is exhausted
        std::optional<ByteSpan> next();

    private:
        friend class Pattern;
        struct State;

        explicit Scanner(std::unique_ptr<State> state);

        std::unique_ptr<State> state_;
    };

    // Throws PatternError on a malformed expression
    explicit Pattern(const std::string& expression);

    static Pattern literal(const std::string& text);

    const std::string& expression() const { return expression_; }

    Scanner scan(const std::string& text) const;
    Scanner scan(const std::string&& text) const = delete;

    std::optional<ByteSpan> find_first(const std::string& text) const;

    // Non-overlapping matches, left to right
    std::vector<ByteSpan> find_all(const std::string& text) const;

private:
    struct Impl;

    std::string expression_;
    std::shared_ptr<const Impl> impl_;
};

} // namespace ez
