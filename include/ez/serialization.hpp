// include/ez/serialization.hpp
#pragma once

#include "ez/ez_string.hpp"
#include "ez/grapheme_match.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <nlohmann/json.hpp>

namespace ez {

// Only the raw text is archived; caches rebuild lazily after loading
template <class Archive>
void save(Archive& archive, const EzStr& str) {
    archive(cereal::make_nvp("text", str.str()));
}

template <class Archive>
void load(Archive& archive, EzStr& str) {
    std::string text;
    archive(cereal::make_nvp("text", text));
    str = EzStr(std::move(text));
}

template <class Archive>
void save(Archive& archive, const GraphemeMatch& match) {
    archive(
        cereal::make_nvp("start", static_cast<std::uint64_t>(match.start())),
        cereal::make_nvp("end", static_cast<std::uint64_t>(match.end())),
        cereal::make_nvp("text", match.text())
    );
}

template <class Archive>
void load(Archive& archive, GraphemeMatch& match) {
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    EzStr text;
    archive(
        cereal::make_nvp("start", start),
        cereal::make_nvp("end", end),
        cereal::make_nvp("text", text)
    );
    match = GraphemeMatch(static_cast<size_t>(start), static_cast<size_t>(end), std::move(text));
}

// Binary archive of a match list
void save_matches(const std::filesystem::path& path, const std::vector<GraphemeMatch>& matches);
std::vector<GraphemeMatch> load_matches(const std::filesystem::path& path);

// {"start": S, "end": E, "text": "..."}
void to_json(nlohmann::json& j, const GraphemeMatch& match);
void from_json(const nlohmann::json& j, GraphemeMatch& match);

} // namespace ez
