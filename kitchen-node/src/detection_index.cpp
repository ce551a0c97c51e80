#include "detection_index.hpp"

#include <filesystem>

namespace kitchen {

const Detection* find_best(const std::vector<Detection>& detections, ObjectClass cls, double threshold) {
    for (const auto& d : detections) {
        if (d.cls == cls && d.confidence >= threshold) return &d;
    }
    return nullptr;
}

std::vector<const Detection*> find_all(const std::vector<Detection>& detections, ObjectClass cls, double threshold) {
    std::vector<const Detection*> out;
    for (const auto& d : detections) {
        if (d.cls == cls && d.confidence >= threshold) out.push_back(&d);
    }
    return out;
}

std::string crop_key(const std::string& crop_ref) {
    return std::filesystem::path(crop_ref).filename().string();
}

const Classification* classification_for(const Detection& detection,
                                         const std::map<std::string, Classification>& classifications) {
    if (!detection.crop_ref || detection.crop_ref->empty()) return nullptr;
    auto it = classifications.find(crop_key(*detection.crop_ref));
    if (it == classifications.end()) return nullptr;
    return &it->second;
}

}  // namespace kitchen
