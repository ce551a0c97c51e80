#include "frame_types.hpp"

#include <cctype>
#include <unordered_map>

namespace kitchen {

std::string canonical(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

ObjectClass object_class_from_label(const std::string& label) {
    // "flame" is what the kitchen YOLO model calls fire.
    static const std::unordered_map<std::string, ObjectClass> labels = {
        {"person", ObjectClass::Person}, {"stove", ObjectClass::Stove},
        {"oven", ObjectClass::Oven},     {"knife", ObjectClass::Knife},
        {"pan", ObjectClass::Pan},       {"pot", ObjectClass::Pot},
        {"fire", ObjectClass::Fire},     {"flame", ObjectClass::Fire},
        {"smoke", ObjectClass::Smoke},
    };
    auto it = labels.find(canonical(label));
    return it == labels.end() ? ObjectClass::Unknown : it->second;
}

// Exact match: the classifier writes these spellings and nothing else.
ObjectStatus object_status_from_string(const std::string& status) {
    static const std::unordered_map<std::string, ObjectStatus> statuses = {
        {"ON", ObjectStatus::On},
        {"OFF", ObjectStatus::Off},
        {"in-use", ObjectStatus::InUse},
        {"unattended", ObjectStatus::Unattended},
        {"empty", ObjectStatus::Empty},
    };
    auto it = statuses.find(status);
    return it == statuses.end() ? ObjectStatus::Unknown : it->second;
}

}  // namespace kitchen
