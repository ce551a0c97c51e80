#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace kitchen {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static double number_or(const nlohmann::json& j, const char* key, double fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number()) {
        throw ConfigError(std::string("config key '") + key + "' must be a number");
    }
    return v.get<double>();
}

void validate(const SafetyConfig& cfg) {
    if (!(cfg.safe_distance_threshold > 0.0)) {
        throw ConfigError("safe_distance_threshold must be positive");
    }
    if (!(cfg.confidence_threshold >= 0.0 && cfg.confidence_threshold <= 1.0)) {
        throw ConfigError("confidence_threshold must be within [0, 1]");
    }
    if (!(cfg.alert_cooldown.count() >= 0.0)) {
        throw ConfigError("alert_cooldown must be non-negative");
    }
    if (!(cfg.knife_danger_distance > 0.0)) {
        throw ConfigError("knife_danger_distance must be positive");
    }
}

SafetyConfig load_safety_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("unable to open config file: " + path);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("invalid JSON in config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config file must hold a JSON object: " + path);
    }

    SafetyConfig cfg;
    cfg.safe_distance_threshold = number_or(j, "safe_distance_threshold", cfg.safe_distance_threshold);
    cfg.confidence_threshold = number_or(j, "confidence_threshold", cfg.confidence_threshold);
    cfg.alert_cooldown = std::chrono::duration<double>(number_or(j, "alert_cooldown", cfg.alert_cooldown.count()));
    cfg.knife_danger_distance = number_or(j, "knife_danger_distance", cfg.knife_danger_distance);
    validate(cfg);
    return cfg;
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env_cfg = std::getenv("KITCHEN_SAFETY_CONFIG")) cfg.config_path = env_cfg;
    if (const char* env_logs = std::getenv("KITCHEN_ALERT_LOG_DIR")) cfg.log_dir = env_logs;
    if (const char* env_watch = std::getenv("KITCHEN_WATCH_DIR")) cfg.watch_dir = env_watch;
    if (const char* env_poll = std::getenv("KITCHEN_POLL_MS")) cfg.poll_ms = std::atoi(env_poll);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--detections") && next()) {
            cfg.detections_path = next();
            i++;
        } else if (arg_eq(arg, "--classifications") && next()) {
            cfg.classifications_path = next();
            i++;
        } else if (arg_eq(arg, "--config") && next()) {
            cfg.config_path = next();
            i++;
        } else if (arg_eq(arg, "--log-dir") && next()) {
            cfg.log_dir = next();
            i++;
        } else if (arg_eq(arg, "--watch") && next()) {
            cfg.watch_dir = next();
            i++;
        } else if (arg_eq(arg, "--poll-ms") && next()) {
            cfg.poll_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--no-audio")) {
            cfg.audio_enabled = false;
        } else if (arg_eq(arg, "--no-log")) {
            cfg.logging_enabled = false;
        } else if (arg_eq(arg, "--no-cooldown")) {
            cfg.cooldown_enabled = false;
        } else if (arg_eq(arg, "--status")) {
            cfg.print_status = true;
        } else if (arg_eq(arg, "--summary")) {
            cfg.print_summary = true;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: kitchen_guard --detections <json> --classifications <json>\n"
                      << "                     [--config <json>] [--log-dir <dir>] [--status] [--summary]\n"
                      << "                     [--no-audio] [--no-log] [--no-cooldown]\n"
                      << "       kitchen_guard --watch <dir> [--poll-ms <int>] [options]\n";
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    if (cfg.poll_ms <= 0) cfg.poll_ms = 1000;
    return cfg;
}

}  // namespace kitchen
