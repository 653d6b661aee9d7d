// src/core/grapheme_match.cpp
#include "ez/grapheme_match.hpp"
#include "ez/errors.hpp"
#include "ez/runtime/settings.hpp"
#include "ez/unicode/unicode_utils.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace ez {

GraphemeMatch::GraphemeMatch() : start_(0), end_(0) {}

GraphemeMatch::GraphemeMatch(size_t start, size_t end, EzStr text)
    : start_(start), end_(end), text_(std::move(text)) {}

bool GraphemeMatch::is_valid(const EzStr& source) const {
    if (start_ > source.size() || end_ > source.size()) {
        return false;
    }
    EzStr found = source.slice(static_cast<std::ptrdiff_t>(start_), static_cast<std::ptrdiff_t>(end_));
    return found == text_;
}

void GraphemeMatch::ensure_valid(const EzStr& source) const {
    if (is_valid(source)) {
        if (runtime::Settings::get_instance().log_successful_validation()) {
            std::cout << "[VALIDATE] Successful match found at: " + debug_string() + "\n";
        }
        return;
    }

    std::string actual;
    std::ostringstream oss;
    oss << "substring " << text_.debug_string() << " not at source.slice(" << start_ << ", " << end_ << "): ";
    if (start_ > source.size() || end_ > source.size()) {
        oss << "indices out of range for source of " << source.size() << " graphemes";
    } else {
        actual = source.slice(static_cast<std::ptrdiff_t>(start_), static_cast<std::ptrdiff_t>(end_)).str();
        oss << unicode::quote(actual);
    }
    oss << "\n";

    // Search for the expected text literally to show where it really is
    const Pattern literal = Pattern::literal(text_.str());
    std::vector<ByteSpan> byte_occurrences = literal.find_all(source.str());
    std::vector<GraphemeMatch> occurrences;
    occurrences.reserve(byte_occurrences.size());
    for (const auto& span : byte_occurrences) {
        occurrences.push_back(source.match_from_bytes(span));
    }

    if (!occurrences.empty()) {
        const size_t limit = std::min(occurrences.size(),
                                      runtime::Settings::get_instance().max_reported_occurrences());
        oss << "found instead at " << occurrences.size() << " location(s):\n";
        for (size_t i = 0; i < limit; ++i) {
            oss << "  [" << occurrences[i].start() << ", " << occurrences[i].end() << ") bytes "
                << byte_occurrences[i] << ": " << occurrences[i].text().debug_string() << "\n";
        }
        if (limit < occurrences.size()) {
            oss << "  ... and " << (occurrences.size() - limit) << " more\n";
        }
    } else {
        oss << "text does not occur anywhere in the source\n";
    }

    oss << "Invalid " << debug_string() << "\n"
        << "source: " << source.debug_string();

    throw MatchValidityError(oss.str(), *this, std::move(actual),
                             std::move(byte_occurrences), std::move(occurrences));
}

std::string GraphemeMatch::debug_string() const {
    std::ostringstream oss;
    oss << "GraphemeMatch { start: " << start_ << ", end: " << end_
        << ", text: " << text_.debug_string() << " }";
    return oss.str();
}

} // namespace ez
