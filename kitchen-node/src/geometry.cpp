#include "geometry.hpp"

#include <cmath>

namespace kitchen {

cv::Point center_of(const cv::Rect& box) {
    // Widened so corners near INT_MAX do not overflow.
    const long long x1 = box.x;
    const long long y1 = box.y;
    const long long x2 = x1 + box.width;
    const long long y2 = y1 + box.height;
    return cv::Point(static_cast<int>((x1 + x2) / 2), static_cast<int>((y1 + y2) / 2));
}

double distance(const cv::Point& a, const cv::Point& b) {
    const double dx = static_cast<double>(b.x) - static_cast<double>(a.x);
    const double dy = static_cast<double>(b.y) - static_cast<double>(a.y);
    return std::sqrt(dx * dx + dy * dy);
}

}  // namespace kitchen
