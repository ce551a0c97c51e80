#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kitchen {

// Numeric value is the rank used to pick the overall kitchen status.
enum class Severity { LOW = 1, MEDIUM = 2, HIGH = 3, CRITICAL = 4 };

enum class AlertType {
    FIRE_DETECTED,
    SMOKE_DETECTED,
    STOVE_UNATTENDED,
    STOVE_TOO_FAR,
    KNIFE_UNATTENDED,
    PAN_OVERHEATING,
};

inline int severity_rank(Severity s) {
    return static_cast<int>(s);
}

inline std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::CRITICAL: return "CRITICAL";
        case Severity::HIGH: return "HIGH";
        case Severity::MEDIUM: return "MEDIUM";
        default: return "LOW";
    }
}

std::string alert_type_to_string(AlertType type);

// Severity is a property of the alert type and never recomputed.
Severity severity_for(AlertType type);

struct Alert {
    AlertType type{AlertType::FIRE_DETECTED};
    Severity severity{Severity::LOW};
    std::string message;
    std::string voice_alert;
    nlohmann::json details = nlohmann::json::object();
    std::string timestamp;                   // stamped by the orchestrator
    std::optional<long long> frame_number;   // "unknown" when absent
};

Alert make_alert(AlertType type, std::string message, std::string voice_alert, nlohmann::json details);

nlohmann::json to_json(const Alert& alert);

// Aggregate status of one frame's alert batch.
struct KitchenStatus {
    std::string status;   // SAFE, EMERGENCY, DANGER, WARNING, CAUTION
    std::string message;
    std::string color;
    std::size_t alert_count{0};
};

KitchenStatus overall_status(const std::vector<Alert>& alerts);

}  // namespace kitchen
