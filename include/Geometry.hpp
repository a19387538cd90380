#pragma once

#include <opencv2/core.hpp>

namespace ppeAI {

// Largest accepted coordinate magnitude; x + width stays inside int range
constexpr int kMaxCoordinate = 1 << 29;

// Builds a box from corner coordinates (x1,y1) top-left, (x2,y2) bottom-right.
// No validation: x2 <= x1 yields a non-positive width. Callers keep corners
// within +/-kMaxCoordinate so the width and height fit in an int.
cv::Rect rectFromCorners(int x1, int y1, int x2, int y2);

// Intersection over union, 0 for disjoint or degenerate boxes.
float calculateIoU(const cv::Rect& box1, const cv::Rect& box2);

// Fraction of inner's area lying inside outer, in [0, 1]. Used instead of IoU
// for small items (helmets, masks) measured against a large person box.
float containmentFraction(const cv::Rect& inner, const cv::Rect& outer);

// Top heightFraction of the person box, full width.
cv::Rect headRegion(const cv::Rect& person, float heightFraction);

// Top heightFraction of the person box, widthFraction of its width,
// horizontally centered at centerFraction of the width and clipped to the box.
cv::Rect faceRegion(const cv::Rect& person, float heightFraction,
                    float widthFraction, float centerFraction);

} // namespace ppeAI
