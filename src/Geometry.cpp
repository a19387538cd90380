#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace ppeAI {

namespace {

// Region heights and widths are whole pixels, never collapsing to zero
int scaledLength(int length, float fraction) {
    int scaled = static_cast<int>(std::lround(length * fraction));
    return std::max(1, std::min(scaled, length));
}

// Areas are taken in 64-bit / double so boxes past 46341 px a side do not overflow
double area(const cv::Rect& box) {
    if (box.width <= 0 || box.height <= 0) {
        return 0.0;
    }
    return static_cast<double>(box.width) * static_cast<double>(box.height);
}

double intersectionArea(const cv::Rect& a, const cv::Rect& b) {
    std::int64_t x1 = std::max<std::int64_t>(a.x, b.x);
    std::int64_t y1 = std::max<std::int64_t>(a.y, b.y);
    std::int64_t x2 = std::min(static_cast<std::int64_t>(a.x) + a.width,
                               static_cast<std::int64_t>(b.x) + b.width);
    std::int64_t y2 = std::min(static_cast<std::int64_t>(a.y) + a.height,
                               static_cast<std::int64_t>(b.y) + b.height);

    if (x2 <= x1 || y2 <= y1) {
        return 0.0;
    }
    return static_cast<double>(x2 - x1) * static_cast<double>(y2 - y1);
}

} // namespace

cv::Rect rectFromCorners(int x1, int y1, int x2, int y2) {
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

float calculateIoU(const cv::Rect& box1, const cv::Rect& box2) {
    double intersection_area = intersectionArea(box1, box2);
    if (intersection_area <= 0.0) {
        return 0.0f;
    }

    double union_area = area(box1) + area(box2) - intersection_area;
    if (union_area <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(intersection_area / union_area);
}

float containmentFraction(const cv::Rect& inner, const cv::Rect& outer) {
    if (inner.width <= 0 || inner.height <= 0) {
        return 0.0f;
    }
    return static_cast<float>(intersectionArea(inner, outer) / area(inner));
}

cv::Rect headRegion(const cv::Rect& person, float heightFraction) {
    return cv::Rect(person.x, person.y, person.width, scaledLength(person.height, heightFraction));
}

cv::Rect faceRegion(const cv::Rect& person, float heightFraction,
                    float widthFraction, float centerFraction) {
    int height = scaledLength(person.height, heightFraction);
    int width = scaledLength(person.width, widthFraction);

    float centerX = person.x + person.width * centerFraction;
    int left = static_cast<int>(std::lround(centerX - width / 2.0f));

    return cv::Rect(left, person.y, width, height) & person;
}

} // namespace ppeAI
