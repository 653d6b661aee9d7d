// src/core/serialization.cpp
#include "ez/serialization.hpp"
#include <cereal/archives/binary.hpp>
#include <fstream>
#include <stdexcept>

namespace ez {

void save_matches(const std::filesystem::path& path, const std::vector<GraphemeMatch>& matches) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }

    try {
        cereal::BinaryOutputArchive archive(file);
        archive(matches);
    } catch (const cereal::Exception& e) {
        throw std::runtime_error("Failed to save matches: " + std::string(e.what()));
    }
}

std::vector<GraphemeMatch> load_matches(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for reading: " + path.string());
    }

    std::vector<GraphemeMatch> matches;
    try {
        cereal::BinaryInputArchive archive(file);
        archive(matches);
    } catch (const cereal::Exception& e) {
        throw std::runtime_error("Failed to load matches: " + std::string(e.what()));
    }
    return matches;
}

void to_json(nlohmann::json& j, const GraphemeMatch& match) {
    j = nlohmann::json{
        {"start", match.start()},
        {"end", match.end()},
        {"text", match.as_str()}
    };
}

void from_json(const nlohmann::json& j, GraphemeMatch& match) {
    match = GraphemeMatch(j.at("start").get<size_t>(),
                          j.at("end").get<size_t>(),
                          EzStr(j.at("text").get<std::string>()));
}

} // namespace ez
