#pragma once

#include <chrono>
#include <string>

namespace kitchen {

// Rule thresholds. Distances are in pixels of the detector's input frame.
struct SafetyConfig {
    double safe_distance_threshold{200.0};  // person must stay within this of an active stove
    double confidence_threshold{0.7};       // detection confidence floor
    std::chrono::duration<double> alert_cooldown{5.0};
    double knife_danger_distance{100.0};    // person closer than this is handling the knife
};

// Throws ConfigError on out-of-range values.
void validate(const SafetyConfig& cfg);

// Reads the JSON config file. Missing keys keep their defaults.
SafetyConfig load_safety_config(const std::string& path);

struct AppConfig {
    std::string detections_path{};
    std::string classifications_path{};
    std::string config_path{};        // optional SafetyConfig JSON
    std::string log_dir{"outputs/logs"};
    std::string watch_dir{};          // monitor mode when set
    int poll_ms{1000};
    bool audio_enabled{true};
    bool logging_enabled{true};
    bool cooldown_enabled{true};
    bool print_status{false};
    bool print_summary{false};
};

AppConfig parse_args(int argc, char** argv);

}  // namespace kitchen
