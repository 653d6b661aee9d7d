// src/unicode/unicode_utils.cpp
#include "ez/unicode/unicode_utils.hpp"
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>
#include <memory>
#include <stdexcept>

namespace ez::unicode {

std::vector<GraphemeBoundary> segment_graphemes(const std::string& text) {
    std::vector<GraphemeBoundary> clusters;
    if (text.empty()) {
        return clusters;
    }

    UErrorCode status = U_ZERO_ERROR;

    // UTF-8 UText keeps native indices in bytes
    icu::LocalUTextPointer utext(
        utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Cannot open UTF-8 text: ") + u_errorName(status));
    }

    std::unique_ptr<icu::BreakIterator> breaker(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status) || !breaker) {
        throw std::runtime_error(std::string("Cannot create character break iterator: ") + u_errorName(status));
    }

    breaker->setText(utext.getAlias(), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Cannot attach text to break iterator: ") + u_errorName(status));
    }

    int32_t start = breaker->first();
    for (int32_t end = breaker->next(); end != icu::BreakIterator::DONE; start = end, end = breaker->next()) {
        clusters.push_back({static_cast<size_t>(start),
                            text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start))});
    }

    return clusters;
}

std::string normalize(const std::string& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Unicode normalization failed: ") + u_errorName(status));
    }

    icu::UnicodeString unicode_str = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString normalized = nfc->normalize(unicode_str, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Unicode normalization failed: ") + u_errorName(status));
    }

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

std::vector<CodePoint> to_code_points(const std::string& text) {
    std::vector<CodePoint> code_points;
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());

    for (int32_t i = 0; i < length; ) {
        const int32_t begin = i;
        UChar32 codepoint;

        // Decode UTF-8; advances i past the sequence
        U8_NEXT(bytes, i, length, codepoint);

        if (codepoint < 0) {
            // Ill-formed sequence: replacement character, resume after the first byte
            code_points.push_back({0xFFFD, "\xEF\xBF\xBD"});
            i = begin + 1;
            continue;
        }

        code_points.push_back({static_cast<uint32_t>(codepoint),
                               text.substr(static_cast<size_t>(begin), static_cast<size_t>(i - begin))});
    }

    return code_points;
}

size_t code_point_count(const std::string& text) {
    return to_code_points(text).size();
}

bool is_valid_utf8(const std::string& text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());

    for (int32_t i = 0; i < length; ) {
        UChar32 codepoint;
        U8_NEXT(bytes, i, length, codepoint);
        if (codepoint < 0) {
            return false;
        }
    }
    return true;
}

std::string quote(const std::string& text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';
    for (char c : text) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    result += '"';
    return result;
}

} // namespace ez::unicode
