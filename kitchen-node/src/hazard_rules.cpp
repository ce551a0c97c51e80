#include "hazard_rules.hpp"

#include "detection_index.hpp"
#include "geometry.hpp"

namespace kitchen {

namespace {
nlohmann::json point_json(const cv::Point& p) {
    return nlohmann::json::array({p.x, p.y});
}

bool has_status(const Classification* c, ObjectStatus status) {
    return c != nullptr && c->status == status;
}
}  // namespace

std::optional<Alert> check_fire_smoke(const std::vector<Detection>& dets, const SafetyConfig& cfg) {
    const Detection* fire = find_best(dets, ObjectClass::Fire, cfg.confidence_threshold);
    if (fire) {
        return make_alert(AlertType::FIRE_DETECTED,
                          "DANGER DANGER DANGER! FIRE DETECTED IN KITCHEN! EVACUATE NOW AND CALL 911!",
                          "Fire detected! Danger! Danger! Danger! Evacuate immediately!",
                          {{"hazard", "fire"},
                           {"confidence", fire->confidence},
                           {"location", point_json(fire->center)},
                           {"action_required", "EVACUATE AND CALL EMERGENCY SERVICES"}});
    }

    const Detection* smoke = find_best(dets, ObjectClass::Smoke, cfg.confidence_threshold);
    if (smoke) {
        return make_alert(AlertType::SMOKE_DETECTED,
                          "DANGER! SMOKE DETECTED! Possible fire hazard - check kitchen immediately!",
                          "Smoke detected! Danger! Check the kitchen immediately!",
                          {{"hazard", "smoke"},
                           {"confidence", smoke->confidence},
                           {"location", point_json(smoke->center)},
                           {"action_required", "CHECK FOR FIRE SOURCE IMMEDIATELY"}});
    }

    return std::nullopt;
}

std::optional<Alert> check_pan_overheating(const std::vector<Detection>& dets,
                                           const ClassificationMap& classifications,
                                           const SafetyConfig& cfg) {
    const Detection* pan = find_best(dets, ObjectClass::Pan, cfg.confidence_threshold);
    const Detection* stove = find_best(dets, ObjectClass::Stove, cfg.confidence_threshold);
    if (!pan || !stove) return std::nullopt;

    const Classification* stove_status = classification_for(*stove, classifications);
    if (!has_status(stove_status, ObjectStatus::On)) return std::nullopt;

    const Classification* pan_status = classification_for(*pan, classifications);
    if (!has_status(pan_status, ObjectStatus::Empty)) return std::nullopt;

    const double d = distance(pan->center, stove->center);
    if (d >= kPanOnBurnerDistance) return std::nullopt;

    return make_alert(AlertType::PAN_OVERHEATING,
                      "DANGER! Empty pan on active stove! This can cause FIRE or damage! Add food/liquid or remove from heat!",
                      "Danger! Empty pan on hot stove! Risk of fire! Please add contents or remove the pan!",
                      {{"pan_status", pan_status->raw_status},
                       {"stove_status", stove_status->raw_status},
                       {"pan_stove_distance", static_cast<int>(d)},
                       {"risk_level", "HIGH - Fire hazard"},
                       {"action_required", "Add contents to pan or remove from heat"}});
}

std::optional<Alert> check_stove_unattended(const std::vector<Detection>& dets,
                                            const ClassificationMap& classifications,
                                            const SafetyConfig& cfg) {
    const Detection* stove = find_best(dets, ObjectClass::Stove, cfg.confidence_threshold);
    if (!stove) return std::nullopt;

    const Classification* stove_status = classification_for(*stove, classifications);
    if (!has_status(stove_status, ObjectStatus::On)) return std::nullopt;

    const Detection* person = find_best(dets, ObjectClass::Person, cfg.confidence_threshold);
    if (!person) {
        return make_alert(AlertType::STOVE_UNATTENDED,
                          "ALERT! Stove/fire is ON and left UNATTENDED! This is DANGEROUS! Please return to the kitchen immediately!",
                          "Warning! The stove is on and unattended! This is dangerous! Please return to the kitchen!",
                          {{"stove_status", stove_status->raw_status},
                           {"stove_confidence", stove_status->confidence},
                           {"person_detected", false},
                           {"risk_level", "HIGH - No supervision"},
                           {"action_required", "Return to kitchen immediately"}});
    }

    const double d = distance(stove->center, person->center);
    if (d <= cfg.safe_distance_threshold) return std::nullopt;

    const int px = static_cast<int>(d);
    return make_alert(AlertType::STOVE_TOO_FAR,
                      "WARNING: Stove is ON but you're too far away (" + std::to_string(px) +
                          "px)! Stay close while cooking to prevent accidents!",
                      "Warning! You are too far from the active stove. Please stay close while cooking.",
                      {{"stove_status", stove_status->raw_status},
                       {"distance_from_stove", px},
                       {"safe_distance", cfg.safe_distance_threshold},
                       {"person_detected", true},
                       {"risk_level", "MEDIUM - Too far from heat source"}});
}

std::optional<Alert> check_knife_unattended(const std::vector<Detection>& dets,
                                            const ClassificationMap& classifications,
                                            const SafetyConfig& cfg) {
    const Detection* knife = find_best(dets, ObjectClass::Knife, cfg.confidence_threshold);
    if (!knife) return std::nullopt;

    const Classification* knife_status = classification_for(*knife, classifications);
    if (!has_status(knife_status, ObjectStatus::Unattended)) return std::nullopt;

    // A person next to the knife vetoes the classifier.
    const Detection* person = find_best(dets, ObjectClass::Person, cfg.confidence_threshold);
    if (person && distance(knife->center, person->center) < cfg.knife_danger_distance) {
        return std::nullopt;
    }

    return make_alert(AlertType::KNIFE_UNATTENDED,
                      "WARNING: Knife is left unattended! This could be DANGEROUS! Please store the knife safely in a drawer or knife block.",
                      "Warning! A knife is left unattended. This could be dangerous. Please store it safely.",
                      {{"knife_status", knife_status->raw_status},
                       {"confidence", knife_status->confidence},
                       {"features", knife_status->features},
                       {"person_nearby", false},
                       {"risk_level", "MEDIUM - Sharp object unsecured"},
                       {"action_required", "Store knife in drawer or knife block"}});
}

}  // namespace kitchen
