#include "Config.hpp"
#include "../core/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) target = j.at(key).get<T>();
}

} // namespace

AppConfig Config::parse(const std::string& text) {
    AppConfig cfg;
    json j = json::parse(text);

    read(j, "data_file", cfg.data_file);
    read(j, "log_file", cfg.log_file);
    read(j, "log_level", cfg.log_level);
    read(j, "export_vault", cfg.export_vault);
    read(j, "export_folder", cfg.export_folder);
    long long due_limit = static_cast<long long>(cfg.due_limit);
    read(j, "due_limit", due_limit);
    if (due_limit < 1) throw ValidationError("due_limit must be positive, got " + std::to_string(due_limit));
    cfg.due_limit = static_cast<std::size_t>(due_limit);

    if (j.contains("scheduler")) {
        const json& s = j.at("scheduler");
        SchedulerConfig& sc = cfg.scheduler;
        read(s, "initial_ease", sc.initial_ease);
        read(s, "ease_floor", sc.ease_floor);
        read(s, "ease_ceiling", sc.ease_ceiling);
        read(s, "again_penalty", sc.again_penalty);
        read(s, "hard_penalty", sc.hard_penalty);
        read(s, "easy_bonus", sc.easy_bonus);
        read(s, "hard_multiplier", sc.hard_multiplier);
        read(s, "easy_multiplier", sc.easy_multiplier);
        read(s, "lapse_interval_days", sc.lapse_interval_days);
        read(s, "first_interval_days", sc.first_interval_days);
        read(s, "second_interval_days", sc.second_interval_days);
        read(s, "max_interval_days", sc.max_interval_days);
    }
    return cfg;
}

AppConfig Config::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::info("No settings file at '{}'; using defaults", path);
        return AppConfig();
    }

    try {
        std::ifstream f(path);
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return parse(text);
    }
    catch (const json::exception& e) {
        spdlog::warn("Error reading '{}': {}; using defaults", path, e.what());
    }
    catch (const RetainError& e) {
        spdlog::warn("Invalid settings in '{}': {}; using defaults", path, e.what());
    }
    return AppConfig();
}

bool Config::save(const AppConfig& cfg, const std::string& path) {
    const SchedulerConfig& sc = cfg.scheduler;
    json j = {
        {"data_file", cfg.data_file},
        {"log_file", cfg.log_file},
        {"log_level", cfg.log_level},
        {"export_vault", cfg.export_vault},
        {"export_folder", cfg.export_folder},
        {"due_limit", cfg.due_limit},
        {"scheduler", {
            {"initial_ease", sc.initial_ease},
            {"ease_floor", sc.ease_floor},
            {"ease_ceiling", sc.ease_ceiling},
            {"again_penalty", sc.again_penalty},
            {"hard_penalty", sc.hard_penalty},
            {"easy_bonus", sc.easy_bonus},
            {"hard_multiplier", sc.hard_multiplier},
            {"easy_multiplier", sc.easy_multiplier},
            {"lapse_interval_days", sc.lapse_interval_days},
            {"first_interval_days", sc.first_interval_days},
            {"second_interval_days", sc.second_interval_days},
            {"max_interval_days", sc.max_interval_days}
        }}
    };

    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        spdlog::error("Failed to open '{}' for writing settings", path);
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}
