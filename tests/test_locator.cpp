#include "ez/ez.hpp"
#include <iostream>
#include <string>

#undef NDEBUG
#include <cassert>

using namespace ez;

void test_byte_index_table() {
    std::cout << "=== Byte index table ===" << std::endl;

    // a, e + U+0301, b
    EzStr text("ae\xCC\x81" "b");
    const auto& index = text.byte_index();

    assert(index.size() == 3);
    assert((index[0] == ByteIndexEntry{0, 0}));
    assert((index[1] == ByteIndexEntry{1, 1}));
    assert((index[2] == ByteIndexEntry{4, 2}));
}

void test_exact_and_inner_offsets() {
    std::cout << "=== Exact and inner offsets ===" << std::endl;

    EzStr text("ae\xCC\x81" "b");

    assert(text.grapheme_index_at(0) == 0);
    assert(text.grapheme_index_at(1) == 1);
    // Inside the accented cluster: resolves to the following cluster
    assert(text.grapheme_index_at(2) == 2);
    assert(text.grapheme_index_at(3) == 2);
    assert(text.grapheme_index_at(4) == 2);
    // End of text and beyond
    assert(text.grapheme_index_at(5) == 3);
    assert(text.grapheme_index_at(100) == 3);
}

void test_totality_and_monotonicity() {
    std::cout << "=== Totality and monotonicity ===" << std::endl;

    const std::string samples[] = {
        "",
        "plain ascii",
        "\xF0\x9D\x86\x94\xE2\x99\xAA \xF0\x9D\x86\x94\xE2\x99\xAA",
        "cafe\xCC\x81 \xF0\x9F\x87\xAB\xF0\x9F\x87\xB7!",
        "line one\r\nline two"
    };

    for (const auto& sample : samples) {
        EzStr text(sample);
        size_t previous = 0;
        for (size_t b = 0; b <= sample.size(); ++b) {
            size_t g = text.grapheme_index_at(b);
            assert(g >= previous);
            assert(g <= text.size());
            previous = g;
        }
        assert(text.grapheme_index_at(sample.size()) == text.size());
    }
}

void test_match_from_bytes() {
    std::cout << "=== Byte span translation ===" << std::endl;

    EzStr text("\xF0\x9D\x86\x94\xE2\x99\xAA \xF0\x9D\x86\x94\xE2\x99\xAA");
    GraphemeMatch second = text.match_from_bytes(ByteSpan{8, 15});
    assert(second.start() == 3);
    assert(second.end() == 5);
    assert(second.as_str() == "\xF0\x9D\x86\x94\xE2\x99\xAA");
}

int main() {
    try {
        test_byte_index_table();
        test_exact_and_inner_offsets();
        test_totality_and_monotonicity();
        test_match_from_bytes();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All locator tests passed!" << std::endl;
    return 0;
}
