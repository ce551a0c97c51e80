#include "batch_parser.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

#include "errors.hpp"
#include "geometry.hpp"

namespace kitchen {

namespace {

const nlohmann::json& require(const nlohmann::json& obj, const char* key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw InputError(where + ": missing required field '" + key + "'");
    }
    return obj.at(key);
}

double require_confidence(const nlohmann::json& obj, const std::string& where) {
    const auto& v = require(obj, "confidence", where);
    if (!v.is_number()) throw InputError(where + ": 'confidence' must be a number");
    const double c = v.get<double>();
    if (!(c >= 0.0 && c <= 1.0)) throw InputError(where + ": 'confidence' outside [0, 1]");
    return c;
}

std::vector<int> int_array(const nlohmann::json& v, std::size_t n, const std::string& what) {
    if (!v.is_array() || v.size() != n) {
        throw InputError(what + " must be an array of " + std::to_string(n) + " numbers");
    }
    std::vector<int> out;
    out.reserve(n);
    for (const auto& x : v) {
        if (!x.is_number()) throw InputError(what + " must contain only numbers");
        const double value = x.get<double>();
        if (!(value >= static_cast<double>(std::numeric_limits<int>::min()) &&
              value < static_cast<double>(std::numeric_limits<int>::max()) + 1.0)) {
            throw InputError(what + " coordinate " + x.dump() + " is outside the pixel coordinate range");
        }
        out.push_back(static_cast<int>(value));
    }
    return out;
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw InputError("unable to open input file: " + path);
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError("invalid JSON in " + path + ": " + e.what());
    }
}

Detection parse_detection(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) throw InputError(where + ": detection must be an object");

    Detection d;
    const auto& cls = require(j, "class", where);
    if (!cls.is_string()) throw InputError(where + ": 'class' must be a string");
    d.label = cls.get<std::string>();
    d.cls = object_class_from_label(d.label);
    d.confidence = require_confidence(j, where);

    auto box = int_array(require(j, "bbox", where), 4, where + ": 'bbox'");
    if (box[0] > box[2] || box[1] > box[3]) {
        throw InputError(where + ": 'bbox' corners out of order");
    }
    // cv::Rect stores width and height as int.
    const long long max_extent = std::numeric_limits<int>::max();
    if (static_cast<long long>(box[2]) - box[0] > max_extent || static_cast<long long>(box[3]) - box[1] > max_extent) {
        throw InputError(where + ": 'bbox' is wider than the pixel coordinate range");
    }
    d.bbox = cv::Rect(cv::Point(box[0], box[1]), cv::Point(box[2], box[3]));

    if (j.contains("center") && !j.at("center").is_null()) {
        auto c = int_array(j.at("center"), 2, where + ": 'center'");
        d.center = cv::Point(c[0], c[1]);
    } else {
        d.center = center_of(d.bbox);
    }

    // The raw detector writes crop_path; the pipeline output uses cropped_image_path.
    for (const char* key : {"cropped_image_path", "crop_path"}) {
        if (!j.contains(key) || j.at(key).is_null()) continue;
        if (!j.at(key).is_string()) throw InputError(where + ": '" + key + "' must be a string");
        d.crop_ref = j.at(key).get<std::string>();
        break;
    }
    return d;
}

}  // namespace

DetectionBatch parse_detection_batch(const nlohmann::json& doc) {
    if (!doc.is_object()) throw InputError("detection batch must be a JSON object");

    DetectionBatch batch;
    if (doc.contains("timestamp") && doc.at("timestamp").is_string()) {
        batch.timestamp = doc.at("timestamp").get<std::string>();
    }
    if (doc.contains("frame_number") && !doc.at("frame_number").is_null()) {
        const auto& fn = doc.at("frame_number");
        if (!fn.is_number_integer()) throw InputError("detection batch: 'frame_number' must be an integer");
        batch.frame_number = fn.get<long long>();
    }

    const auto& dets = require(doc, "detections", "detection batch");
    if (!dets.is_array()) throw InputError("detection batch: 'detections' must be an array");
    batch.detections.reserve(dets.size());
    for (std::size_t i = 0; i < dets.size(); ++i) {
        batch.detections.push_back(parse_detection(dets[i], "detections[" + std::to_string(i) + "]"));
    }
    return batch;
}

ClassificationBatch parse_classification_batch(const nlohmann::json& doc) {
    if (!doc.is_object()) throw InputError("classification batch must be a JSON object");

    ClassificationBatch batch;
    if (doc.contains("timestamp") && doc.at("timestamp").is_string()) {
        batch.timestamp = doc.at("timestamp").get<std::string>();
    }

    const auto& records = require(doc, "classifications", "classification batch");
    if (!records.is_object()) throw InputError("classification batch: 'classifications' must be an object");
    for (auto it = records.begin(); it != records.end(); ++it) {
        const std::string where = "classifications[" + it.key() + "]";
        const auto& j = it.value();
        if (!j.is_object()) throw InputError(where + ": record must be an object");

        Classification c;
        const auto& status = require(j, "status", where);
        if (!status.is_string()) throw InputError(where + ": 'status' must be a string");
        c.raw_status = status.get<std::string>();
        c.status = object_status_from_string(c.raw_status);
        c.confidence = require_confidence(j, where);
        if (j.contains("features") && !j.at("features").is_null()) {
            if (!j.at("features").is_object()) throw InputError(where + ": 'features' must be an object");
            c.features = j.at("features");
        }
        batch.classifications.emplace(it.key(), std::move(c));
    }
    return batch;
}

DetectionBatch load_detection_batch(const std::string& path) {
    return parse_detection_batch(read_json_file(path));
}

ClassificationBatch load_classification_batch(const std::string& path) {
    return parse_classification_batch(read_json_file(path));
}

void validate_batch(const DetectionBatch& batch) {
    for (std::size_t i = 0; i < batch.detections.size(); ++i) {
        const auto& d = batch.detections[i];
        if (std::isnan(d.confidence) || d.confidence < 0.0 || d.confidence > 1.0) {
            throw InputError("detections[" + std::to_string(i) + "]: confidence outside [0, 1]");
        }
        if (d.bbox.width < 0 || d.bbox.height < 0) {
            throw InputError("detections[" + std::to_string(i) + "]: bounding box has negative size");
        }
    }
}

void validate_batch(const ClassificationBatch& batch) {
    for (const auto& kv : batch.classifications) {
        const double c = kv.second.confidence;
        if (std::isnan(c) || c < 0.0 || c > 1.0) {
            throw InputError("classifications[" + kv.first + "]: confidence outside [0, 1]");
        }
    }
}

}  // namespace kitchen
