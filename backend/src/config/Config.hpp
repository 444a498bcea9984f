#pragma once
#include <string>
#include <cstddef>
#include "../core/Scheduler.hpp"

struct AppConfig {
    std::string data_file = "retain.dat";
    std::string log_file = "retain.log";
    std::string log_level = "info";
    std::string export_vault;            // empty: export disabled
    std::string export_folder = "learnings";
    std::size_t due_limit = 20;
    SchedulerConfig scheduler;
};

// Settings file loader (settings.json). Unknown keys are ignored; a missing
// file gives the defaults.
class Config {
public:
    // Falls back to defaults (with a warning) on unreadable or malformed JSON.
    static AppConfig load(const std::string& path);

    // Throws nlohmann::json::exception on malformed JSON or wrong value types,
    // ValidationError on out-of-range values.
    static AppConfig parse(const std::string& text);

    static bool save(const AppConfig& config, const std::string& path);
};
