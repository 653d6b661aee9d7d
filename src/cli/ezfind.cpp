#include "ez/ez.hpp"
#include "ez/serialization.hpp"
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string config_path;
    std::string save_path;
    std::string pattern;
    std::optional<std::string> text;
    bool literal = false;
    bool first_only = false;
    bool validate = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: ezfind [--config FILE] [--literal] [--first] [--validate] [--save FILE] PATTERN [TEXT]\n"
       << "Reports PATTERN matches in TEXT (or stdin) as grapheme cluster indices.\n";
}

// Returns false on a usage error
bool parse_args(int argc, char** argv, Options& options) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--save") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            (arg == "--config" ? options.config_path : options.save_path) = argv[++i];
        } else if (arg == "--literal") {
            options.literal = true;
        } else if (arg == "--first") {
            options.first_only = true;
        } else if (arg == "--validate") {
            options.validate = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return false;
    }

    options.pattern = positional[0];
    if (positional.size() == 2) {
        options.text = positional[1];
    }
    return true;
}

int run(const Options& options) {
    auto& settings = ez::runtime::Settings::get_instance();
    if (!options.config_path.empty()) {
        settings.initialize(options.config_path);
    }

    std::string raw;
    if (options.text) {
        raw = *options.text;
    } else {
        raw.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    if (!ez::unicode::is_valid_utf8(raw)) {
        ez::runtime::warn("Invalid UTF-8 in input text, ill-formed bytes are segmented as U+FFFD");
    }

    const ez::EzStr source(raw);
    const ez::Pattern pattern = options.literal ? ez::Pattern::literal(options.pattern)
                                                : ez::Pattern(options.pattern);

    std::vector<ez::GraphemeMatch> matches;
    if (options.first_only) {
        if (auto match = source.find(pattern)) {
            matches.push_back(*match);
        }
    } else {
        matches = source.find_all(pattern);
    }

    if (options.validate) {
        for (const auto& match : matches) {
            match.ensure_valid(source);
        }
    }

    if (!options.save_path.empty()) {
        ez::save_matches(options.save_path, matches);
    }

    nlohmann::json report{
        {"length", source.size()},
        {"bytes", source.byte_size()},
        {"count", matches.size()},
        {"matches", matches}
    };
    std::cout << report.dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        print_usage(std::cerr);
        return 2;
    }

    try {
        return run(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
