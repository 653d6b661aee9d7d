#include "ez/ez.hpp"
#include <iostream>
#include <string>

#undef NDEBUG
#include <cassert>

using namespace ez;

void test_valid_match() {
    std::cout << "=== Valid match ===" << std::endl;

    EzStr source("abxy");
    GraphemeMatch match(2, 4, EzStr("xy"));
    assert(match.is_valid(source));
    match.ensure_valid(source);

    runtime::Settings::get_instance().set_log_successful_validation(true);
    match.ensure_valid(source);
    runtime::Settings::get_instance().reset();
}

void test_misplaced_match() {
    std::cout << "=== Misplaced match ===" << std::endl;

    EzStr source("abxy");
    GraphemeMatch match(0, 2, EzStr("xy"));
    assert(!match.is_valid(source));

    bool thrown = false;
    try {
        match.ensure_valid(source);
    } catch (const MatchValidityError& e) {
        thrown = true;
        std::cout << e.what() << std::endl;
        assert(e.expected() == "xy");
        assert(e.actual() == "ab");
        assert(e.match() == match);
        assert(e.byte_occurrences().size() == 1);
        assert((e.byte_occurrences()[0] == ByteSpan{2, 4}));
        assert(e.occurrences().size() == 1);
        assert(e.occurrences()[0].start() == 2);
        assert(e.occurrences()[0].end() == 4);
        assert(std::string(e.what()).find("not at source.slice(0, 2)") != std::string::npos);
    }
    assert(thrown);
}

void test_metacharacters_are_searched_literally() {
    std::cout << "=== Metacharacters searched literally ===" << std::endl;

    EzStr source("|A|B| (x+y)? |A|");
    GraphemeMatch match(0, 3, EzStr("(x+y)?"));

    bool thrown = false;
    try {
        match.ensure_valid(source);
    } catch (const MatchValidityError& e) {
        thrown = true;
        assert(e.occurrences().size() == 1);
        assert(e.occurrences()[0].start() == 6);
        assert(e.occurrences()[0].end() == 12);
    }
    assert(thrown);

    GraphemeMatch pipes(1, 3, EzStr("|A|"));
    thrown = false;
    try {
        pipes.ensure_valid(source);
    } catch (const MatchValidityError& e) {
        thrown = true;
        assert(e.actual() == "A|");
        assert(e.occurrences().size() == 2);
        assert(e.occurrences()[1].start() == 13);
    }
    assert(thrown);
}

void test_out_of_range_match() {
    std::cout << "=== Out of range match ===" << std::endl;

    EzStr source("abc");
    GraphemeMatch match(10, 12, EzStr("a"));
    assert(!match.is_valid(source));

    bool thrown = false;
    try {
        match.ensure_valid(source);
    } catch (const MatchValidityError& e) {
        thrown = true;
        assert(e.actual().empty());
        assert(e.occurrences().size() == 1);
        assert(std::string(e.what()).find("out of range") != std::string::npos);
    }
    assert(thrown);
}

void test_occurrence_report_is_capped() {
    std::cout << "=== Occurrence report cap ===" << std::endl;

    auto& settings = runtime::Settings::get_instance();
    settings.set_max_reported_occurrences(2);

    EzStr source("ab ab ab ab ab");
    GraphemeMatch match(1, 3, EzStr("ab"));

    bool thrown = false;
    try {
        match.ensure_valid(source);
    } catch (const MatchValidityError& e) {
        thrown = true;
        assert(e.occurrences().size() == 5);
        assert(std::string(e.what()).find("... and 3 more") != std::string::npos);
    }
    assert(thrown);

    settings.reset();
}

void test_match_value() {
    std::cout << "=== Match value ===" << std::endl;

    GraphemeMatch none;
    assert(none.start() == 0 && none.end() == 0);
    assert(none.text().empty());
    assert(none.is_valid(EzStr("anything")));

    GraphemeMatch match(3, 5, EzStr("\xF0\x9D\x86\x94\xE2\x99\xAA"));
    assert(match.debug_string() == "GraphemeMatch { start: 3, end: 5, text: \"\xF0\x9D\x86\x94\xE2\x99\xAA\" }");
    assert(match.to_ezstr() == match.text());
    assert(std::hash<GraphemeMatch>{}(match) == std::hash<GraphemeMatch>{}(GraphemeMatch(3, 5, match.text())));
    assert(match != GraphemeMatch(3, 6, match.text()));
}

int main() {
    try {
        test_valid_match();
        test_misplaced_match();
        test_metacharacters_are_searched_literally();
        test_out_of_range_match();
        test_occurrence_report_is_capped();
        test_match_value();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All validator tests passed!" << std::endl;
    return 0;
}
