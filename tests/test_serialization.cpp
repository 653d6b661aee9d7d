#include "ez/ez.hpp"
#include "ez/serialization.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#undef NDEBUG
#include <cassert>

using namespace ez;

void test_binary_archive() {
    std::cout << "=== Binary archive ===" << std::endl;

    EzStr sample("\xF0\x9D\x86\x94\xE2\x99\xAA \xF0\x9D\x86\x94\xE2\x99\xAA");
    auto matches = sample.find_all(Pattern("\xF0\x9D\x86\x94\xE2\x99\xAA"));
    assert(matches.size() == 2);

    auto path = std::filesystem::temp_directory_path() / "ezstr_test_matches.bin";
    save_matches(path, matches);
    auto restored = load_matches(path);
    std::filesystem::remove(path);

    assert(restored == matches);
    for (const auto& match : restored) {
        // Caches rebuild from the restored text
        assert(match.text().size() == 2);
        match.ensure_valid(sample);
    }
}

void test_missing_archive() {
    std::cout << "=== Missing archive ===" << std::endl;

    bool thrown = false;
    try {
        load_matches("/nonexistent/ezstr_matches.bin");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_json() {
    std::cout << "=== JSON ===" << std::endl;

    EzStr table("|A|B|C|D|\n|E|F|G|");
    auto matches = table.find_all(Pattern("[A-Z]\\|"));
    assert(matches.size() == 7);

    nlohmann::json j = matches;
    assert(j.size() == 7);
    assert(j[0]["start"] == 1);
    assert(j[0]["end"] == 3);
    assert(j[0]["text"] == "A|");

    auto restored = j.get<std::vector<GraphemeMatch>>();
    assert(restored == matches);
}

int main() {
    try {
        test_binary_archive();
        test_missing_archive();
        test_json();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All serialization tests passed!" << std::endl;
    return 0;
}
