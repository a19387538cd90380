#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "ComplianceTypes.hpp"

namespace ppeAI {

cv::Scalar colorToBGR(AnnotationColor color);

// Draws every person box in its overall color with its "SAFE | 100%" style
// label. Works on a copy; the input image is left untouched.
cv::Mat annotateImage(const cv::Mat& image, const std::vector<PersonReport>& persons);

} // namespace ppeAI
