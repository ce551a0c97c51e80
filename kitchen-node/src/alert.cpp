#include "alert.hpp"

#include <utility>

namespace kitchen {

std::string alert_type_to_string(AlertType type) {
    switch (type) {
        case AlertType::FIRE_DETECTED: return "FIRE_DETECTED";
        case AlertType::SMOKE_DETECTED: return "SMOKE_DETECTED";
        case AlertType::STOVE_UNATTENDED: return "STOVE_UNATTENDED";
        case AlertType::STOVE_TOO_FAR: return "STOVE_TOO_FAR";
        case AlertType::KNIFE_UNATTENDED: return "KNIFE_UNATTENDED";
        case AlertType::PAN_OVERHEATING: return "PAN_OVERHEATING";
    }
    return "UNKNOWN";
}

Severity severity_for(AlertType type) {
    switch (type) {
        case AlertType::FIRE_DETECTED:
        case AlertType::SMOKE_DETECTED:
            return Severity::CRITICAL;
        case AlertType::STOVE_UNATTENDED:
        case AlertType::PAN_OVERHEATING:
            return Severity::HIGH;
        case AlertType::STOVE_TOO_FAR:
        case AlertType::KNIFE_UNATTENDED:
            return Severity::MEDIUM;
    }
    return Severity::LOW;
}

Alert make_alert(AlertType type, std::string message, std::string voice_alert, nlohmann::json details) {
    Alert a;
    a.type = type;
    a.severity = severity_for(type);
    a.message = std::move(message);
    a.voice_alert = std::move(voice_alert);
    a.details = std::move(details);
    return a;
}

nlohmann::json to_json(const Alert& alert) {
    nlohmann::json j;
    j["type"] = alert_type_to_string(alert.type);
    j["severity"] = severity_to_string(alert.severity);
    j["message"] = alert.message;
    j["voice_alert"] = alert.voice_alert;
    j["details"] = alert.details;
    j["timestamp"] = alert.timestamp;
    if (alert.frame_number) {
        j["frame_number"] = *alert.frame_number;
    } else {
        j["frame_number"] = "unknown";
    }
    return j;
}

KitchenStatus overall_status(const std::vector<Alert>& alerts) {
    KitchenStatus st;
    st.alert_count = alerts.size();
    if (alerts.empty()) {
        st.status = "SAFE";
        st.message = "Kitchen is safe! All clear.";
        st.color = "green";
        return st;
    }

    // Strict comparison keeps the earliest alert on ties.
    const Alert* top = &alerts.front();
    for (const auto& a : alerts) {
        if (severity_rank(a.severity) > severity_rank(top->severity)) top = &a;
    }

    switch (top->severity) {
        case Severity::CRITICAL: st.status = "EMERGENCY"; st.color = "red"; break;
        case Severity::HIGH: st.status = "DANGER"; st.color = "orange"; break;
        case Severity::MEDIUM: st.status = "WARNING"; st.color = "yellow"; break;
        case Severity::LOW: st.status = "CAUTION"; st.color = "blue"; break;
    }
    st.message = top->message;
    return st;
}

}  // namespace kitchen
