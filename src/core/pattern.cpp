// src/core/pattern.cpp
#include "ez/pattern.hpp"
#include "ez/errors.hpp"
#include <unicode/parseerr.h>
#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace ez {

namespace {

constexpr const char* kMetacharacters = "\\^$.|?*+()[]{}/";

void check_search_status(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string(what) + ": " + u_errorName(status));
    }
}

} // anonymous namespace

struct Pattern::Impl {
    std::unique_ptr<icu::RegexPattern> regex;
};

struct Pattern::Scanner::State {
    icu::LocalUTextPointer text;
    std::unique_ptr<icu::RegexMatcher> matcher;
};

std::string escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(kMetacharacters, c) != nullptr) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

Pattern::Pattern(const std::string& expression) : expression_(expression) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error{};

    auto impl = std::make_shared<Impl>();
    impl->regex.reset(icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(expression),
                                                 0, parse_error, status));
    if (U_FAILURE(status) || !impl->regex) {
        throw PatternError("Invalid pattern " + expression + ": " + u_errorName(status) +
                               " at line " + std::to_string(parse_error.line) +
                               ", offset " + std::to_string(parse_error.offset),
                           parse_error.offset);
    }

    impl_ = std::move(impl);
}

Pattern Pattern::literal(const std::string& text) {
    return Pattern(escape(text));
}

Pattern::Scanner Pattern::scan(const std::string& text) const {
    UErrorCode status = U_ZERO_ERROR;
    auto state = std::make_unique<Scanner::State>();

    // UTF-8 UText keeps native indices in bytes
    state->text.adoptInstead(
        utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
    check_search_status(status, "Cannot open UTF-8 text");

    state->matcher.reset(impl_->regex->matcher(status));
    check_search_status(status, "Cannot create pattern matcher");

    state->matcher->reset(state->text.getAlias());
    return Scanner(std::move(state));
}

Pattern::Scanner::Scanner(std::unique_ptr<State> state) : state_(std::move(state)) {}

Pattern::Scanner::Scanner(Scanner&& other) noexcept = default;

Pattern::Scanner& Pattern::Scanner::operator=(Scanner&& other) noexcept = default;

Pattern::Scanner::~Scanner() = default;

std::optional<ByteSpan> Pattern::Scanner::next() {
    UErrorCode status = U_ZERO_ERROR;
    if (!state_->matcher->find(status)) {
        check_search_status(status, "Pattern search failed");
        return std::nullopt;
    }

    const int64_t start = state_->matcher->start64(status);
    const int64_t end = state_->matcher->end64(status);
    check_search_status(status, "Cannot read match bounds");

    return ByteSpan{static_cast<size_t>(start), static_cast<size_t>(end)};
}

std::optional<ByteSpan> Pattern::find_first(const std::string& text) const {
    return scan(text).next();
}

std::vector<ByteSpan> Pattern::find_all(const std::string& text) const {
    std::vector<ByteSpan> spans;
    Scanner scanner = scan(text);
    for (auto span = scanner.next(); span; span = scanner.next()) {
        spans.push_back(*span);
    }
    return spans;
}

} // namespace ez
