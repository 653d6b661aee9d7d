// src/core/ez_string.cpp
#include "ez/ez_string.hpp"
#include "ez/errors.hpp"
#include "ez/grapheme_match.hpp"
#include "ez/runtime/settings.hpp"
#include "ez/unicode/unicode_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ez {

namespace {

bool debug_enabled() {
    return runtime::Settings::get_instance().debug_logging();
}

void log_segmentation(const std::string& text, size_t clusters) {
    if (!debug_enabled()) return;
    std::ostringstream oss;
    oss << "Segmented " << text.size() << " bytes into " << clusters << " graphemes: "
        << unicode::quote(text);
    runtime::debug_log("SEGMENT", oss.str());
}

void log_byte_index(size_t entries) {
    if (!debug_enabled()) return;
    runtime::debug_log("LOCATE", "Built byte index with " + std::to_string(entries) + " entries");
}

void log_translation(const ByteSpan& span, size_t g_start, size_t g_end) {
    if (!debug_enabled()) return;
    std::ostringstream oss;
    oss << "Bytes " << span << " -> graphemes [" << g_start << ", " << g_end << ")";
    runtime::debug_log("MATCH", oss.str());
}

} // anonymous namespace

EzStr::EzStr() : EzStr(std::string()) {}

EzStr::EzStr(std::string data)
    : data_(std::move(data)), caches_(std::make_shared<Caches>()) {}

EzStr::EzStr(const char* data) : EzStr(std::string(data ? data : "")) {}

EzStr::EzStr(char c) : EzStr(std::string(1, c)) {}

size_t EzStr::size() const {
    return graphemes().size();
}

const EzStr::Segmentation& EzStr::segmentation() const {
    return caches_->segmentation.get_or_init([this] {
        Segmentation result;
        auto boundaries = unicode::segment_graphemes(data_);
        result.graphemes.reserve(boundaries.size());
        result.byte_index.reserve(boundaries.size());
        for (size_t i = 0; i < boundaries.size(); ++i) {
            result.byte_index.push_back({boundaries[i].byte_offset, i});
            result.graphemes.emplace_back(std::move(boundaries[i].text));
        }
        log_segmentation(data_, result.graphemes.size());
        log_byte_index(result.byte_index.size());
        return result;
    });
}

const std::vector<Grapheme>& EzStr::graphemes() const {
    return segmentation().graphemes;
}

const std::vector<ByteIndexEntry>& EzStr::byte_index() const {
    return segmentation().byte_index;
}

size_t EzStr::grapheme_index_at(size_t byte_offset) const {
    const auto& index = byte_index();

    auto it = std::lower_bound(index.begin(), index.end(), byte_offset,
                               [](const ByteIndexEntry& entry, size_t offset) {
                                   return entry.byte_offset < offset;
                               });
    if (it == index.end()) {
        return index.size();
    }
    return it->grapheme_index;
}

const Grapheme& EzStr::at(size_t index) const {
    const auto& clusters = graphemes();
    if (index >= clusters.size()) {
        throw IndexError("grapheme index " + std::to_string(index) +
                         " out of range for string of " + std::to_string(clusters.size()) + " graphemes");
    }
    return clusters[index];
}

EzStr EzStr::slice(std::ptrdiff_t start, std::ptrdiff_t end) const {
    const auto& clusters = graphemes();
    const auto count = static_cast<std::ptrdiff_t>(clusters.size());

    std::ptrdiff_t first = start < 0 ? count + start + 1 : start;
    std::ptrdiff_t last = end < 0 ? count + end + 1 : end;

    if (first < 0 || first > count || last < 0 || last > count) {
        std::ostringstream oss;
        oss << "slice(" << start << ", " << end << ") resolves to [" << first << ", " << last
            << ") which is out of range for string of " << count << " graphemes";
        throw IndexError(oss.str());
    }

    std::string result;
    for (std::ptrdiff_t i = first; i < last; ++i) {
        result += clusters[static_cast<size_t>(i)].value;
    }
    return EzStr(std::move(result));
}

bool EzStr::contains(const std::string& substring) const {
    return data_.find(substring) != std::string::npos;
}

std::optional<GraphemeMatch> EzStr::find(const Pattern& pattern) const {
    auto span = pattern.find_first(data_);
    if (!span) {
        return std::nullopt;
    }
    return match_from_bytes(*span);
}

MatchRange EzStr::find_iter(const Pattern& pattern) const& {
    return MatchRange(*this, pattern);
}

std::vector<GraphemeMatch> EzStr::find_all(const Pattern& pattern) const {
    std::vector<GraphemeMatch> matches;
    for (auto match : find_iter(pattern)) {
        matches.push_back(std::move(match));
    }
    return matches;
}

GraphemeMatch EzStr::match_from_bytes(const ByteSpan& span) const {
    const size_t g_start = grapheme_index_at(span.start);
    const size_t g_end = grapheme_index_at(span.end);
    log_translation(span, g_start, g_end);

    // Text comes from cluster boundaries, not the raw byte span
    return GraphemeMatch(g_start, g_end,
                         slice(static_cast<std::ptrdiff_t>(g_start), static_cast<std::ptrdiff_t>(g_end)));
}

EzStr EzStr::normalized() const {
    return EzStr(unicode::normalize(data_));
}

int EzStr::to_int() const {
    if (data_.empty() || std::isspace(static_cast<unsigned char>(data_.front()))) {
        throw std::invalid_argument("not an integer: " + unicode::quote(data_));
    }

    size_t consumed = 0;
    const int value = std::stoi(data_, &consumed, 10);
    if (consumed != data_.size()) {
        throw std::invalid_argument("trailing characters in integer: " + unicode::quote(data_));
    }
    return value;
}

std::string EzStr::debug_string() const {
    return unicode::quote(data_);
}

EzStr operator+(const EzStr& lhs, const EzStr& rhs) {
    return EzStr(lhs.str() + rhs.str());
}

EzStr operator+(const EzStr& lhs, const std::string& rhs) {
    return EzStr(lhs.str() + rhs);
}

EzStr operator+(const EzStr& lhs, const char* rhs) {
    return EzStr(lhs.str() + (rhs ? rhs : ""));
}

} // namespace ez
