#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "frame_types.hpp"

namespace kitchen {

// Input boundary. Every function here throws InputError on malformed input;
// nothing downstream of it reports errors.

DetectionBatch parse_detection_batch(const nlohmann::json& doc);
ClassificationBatch parse_classification_batch(const nlohmann::json& doc);

DetectionBatch load_detection_batch(const std::string& path);
ClassificationBatch load_classification_batch(const std::string& path);

// Checks the invariants of already-typed batches (confidence range, box order).
void validate_batch(const DetectionBatch& batch);
void validate_batch(const ClassificationBatch& batch);

}  // namespace kitchen
