#include "ez/runtime/settings.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ez::runtime {

Settings& Settings::get_instance() {
    static Settings instance;
    return instance;
}

void Settings::initialize(const std::filesystem::path& config_path) {
    std::ifstream f(config_path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config: " + config_path.string() + ": " + e.what());
    }

    load(config);
}

void Settings::load(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::runtime_error("Invalid config: top level must be an object");
    }

    // Parse everything first so a bad value leaves the settings untouched
    bool debug = debug_logging();
    bool log_validation = log_successful_validation();
    size_t max_occurrences = max_reported_occurrences();

    try {
        if (config.contains("logging")) {
            const auto& logging = config.at("logging");
            if (logging.contains("debug")) {
                debug = logging.at("debug").get<bool>();
            }
            if (logging.contains("log_successful_validation")) {
                log_validation = logging.at("log_successful_validation").get<bool>();
            }
        }

        if (config.contains("diagnostics")) {
            const auto& diagnostics = config.at("diagnostics");
            if (diagnostics.contains("max_reported_occurrences")) {
                const auto& value = diagnostics.at("max_reported_occurrences");
                if (!value.is_number_integer() || value.get<long long>() < 0) {
                    throw std::runtime_error("Invalid config: max_reported_occurrences must be a non-negative integer");
                }
                max_occurrences = value.get<size_t>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    set_debug_logging(debug);
    set_log_successful_validation(log_validation);
    set_max_reported_occurrences(max_occurrences);
}

void Settings::reset() noexcept {
    set_debug_logging(false);
    set_log_successful_validation(false);
    set_max_reported_occurrences(kDefaultMaxReportedOccurrences);
}

nlohmann::json Settings::to_json() const {
    return nlohmann::json{
        {"logging", {
            {"debug", debug_logging()},
            {"log_successful_validation", log_successful_validation()}
        }},
        {"diagnostics", {
            {"max_reported_occurrences", max_reported_occurrences()}
        }}
    };
}

void debug_log(const char* tag, const std::string& message) {
    if (!Settings::get_instance().debug_logging()) return;
    std::cout << "[" + std::string(tag) + "] " + message + "\n" << std::flush;
}

void warn(const std::string& message) {
    std::cerr << "Warning: " + message + "\n";
}

} // namespace ez::runtime
