#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace kitchen {

// Object classes the hazard rules know about. Anything else is Unknown and
// never satisfies a rule precondition.
enum class ObjectClass { Person, Stove, Oven, Knife, Pan, Pot, Fire, Smoke, Unknown };

// Classifier output vocabulary. Which values are meaningful depends on the
// object class (stove: On/Off, knife: InUse/Unattended, pan: InUse/Empty).
// Parsed case-sensitively: "ON", "OFF", "in-use", "unattended", "empty".
enum class ObjectStatus { On, Off, InUse, Unattended, Empty, Unknown };

std::string canonical(const std::string& s);
ObjectClass object_class_from_label(const std::string& label);
ObjectStatus object_status_from_string(const std::string& status);

struct Detection {
    ObjectClass cls{ObjectClass::Unknown};
    std::string label;                   // raw detector label
    double confidence{0.0};
    cv::Rect bbox;                       // (x1,y1)-(x2,y2)
    cv::Point center;
    std::optional<std::string> crop_ref; // cropped_image_path, if any
};

struct Classification {
    ObjectStatus status{ObjectStatus::Unknown};
    std::string raw_status;
    double confidence{0.0};
    nlohmann::json features = nlohmann::json::object();
};

struct DetectionBatch {
    std::string timestamp;
    std::optional<long long> frame_number;
    std::vector<Detection> detections;
};

// Classifications keyed by crop basename.
struct ClassificationBatch {
    std::string timestamp;
    std::map<std::string, Classification> classifications;
};

}  // namespace kitchen
