#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "alert.hpp"
#include "config.hpp"
#include "frame_types.hpp"

namespace kitchen {

// A pan closer than this to an active stove is considered to be on the burner.
constexpr double kPanOnBurnerDistance = 150.0;

using ClassificationMap = std::map<std::string, Classification>;

// Each rule reads one frame and the config, returns at most one alert, and
// never throws. Missing detections or classifications mean "no alert".

std::optional<Alert> check_fire_smoke(const std::vector<Detection>& dets, const SafetyConfig& cfg);

std::optional<Alert> check_pan_overheating(const std::vector<Detection>& dets,
                                           const ClassificationMap& classifications,
                                           const SafetyConfig& cfg);

std::optional<Alert> check_stove_unattended(const std::vector<Detection>& dets,
                                            const ClassificationMap& classifications,
                                            const SafetyConfig& cfg);

std::optional<Alert> check_knife_unattended(const std::vector<Detection>& dets,
                                            const ClassificationMap& classifications,
                                            const SafetyConfig& cfg);

}  // namespace kitchen
