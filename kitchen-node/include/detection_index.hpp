#pragma once

#include <map>
#include <string>
#include <vector>

#include "frame_types.hpp"

namespace kitchen {

// First detection of `cls` with confidence >= threshold, in list order.
// Returns nullptr when none qualifies. The pointer is into `detections`.
const Detection* find_best(const std::vector<Detection>& detections, ObjectClass cls, double threshold);

std::vector<const Detection*> find_all(const std::vector<Detection>& detections, ObjectClass cls, double threshold);

// Crop references are matched by file basename, so "a/x.jpg" and "b/x.jpg" share a record.
std::string crop_key(const std::string& crop_ref);

const Classification* classification_for(const Detection& detection,
                                         const std::map<std::string, Classification>& classifications);

}  // namespace kitchen
