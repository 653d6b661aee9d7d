// Runtime Settings Header File
#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace ez::runtime {

class Settings {
public:
    // Singleton access
    static Settings& get_instance();

    // Load from a JSON config file; missing sections keep their values
    void initialize(const std::filesystem::path& config_path);
    void load(const nlohmann::json& config);

    // Restore defaults
    void reset() noexcept;

    nlohmann::json to_json() const;

    bool debug_logging() const noexcept { return debug_logging_.load(std::memory_order_relaxed); }
    void set_debug_logging(bool enable) noexcept { debug_logging_.store(enable, std::memory_order_relaxed); }

    bool log_successful_validation() const noexcept {
        return log_successful_validation_.load(std::memory_order_relaxed);
    }
    void set_log_successful_validation(bool enable) noexcept {
        log_successful_validation_.store(enable, std::memory_order_relaxed);
    }

    size_t max_reported_occurrences() const noexcept {
        return max_reported_occurrences_.load(std::memory_order_relaxed);
    }
    void set_max_reported_occurrences(size_t count) noexcept {
        max_reported_occurrences_.store(count, std::memory_order_relaxed);
    }

    static constexpr size_t kDefaultMaxReportedOccurrences = 32;

private:
    Settings() = default;

    std::atomic<bool> debug_logging_{false};
    std::atomic<bool> log_successful_validation_{false};
    std::atomic<size_t> max_reported_occurrences_{kDefaultMaxReportedOccurrences};
};

// Tagged debug line on std::cout, only when debug logging is on
void debug_log(const char* tag, const std::string& message);

// Warning line on std::cerr
void warn(const std::string& message);

} // namespace ez::runtime
