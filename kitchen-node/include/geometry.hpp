#pragma once

#include <opencv2/core.hpp>

namespace kitchen {

// Integer midpoint of the box, truncating toward zero.
cv::Point center_of(const cv::Rect& box);

double distance(const cv::Point& a, const cv::Point& b);

}  // namespace kitchen
