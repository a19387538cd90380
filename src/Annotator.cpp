#include "Annotator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace ppeAI {

namespace {

constexpr int kBoxThickness = 2;
constexpr double kFontScale = 0.7;
constexpr int kLabelOffset = 10;

} // namespace

cv::Scalar colorToBGR(AnnotationColor color) {
    return color == AnnotationColor::Green ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255);
}

cv::Mat annotateImage(const cv::Mat& image, const std::vector<PersonReport>& persons) {
    cv::Mat canvas = image.clone();
    if (canvas.empty()) {
        return canvas;
    }

    for (const auto& person : persons) {
        cv::Scalar color = colorToBGR(person.color);
        cv::rectangle(canvas, person.bbox, color, kBoxThickness);

        int baseline = 0;
        cv::Size textSize = cv::getTextSize(person.label, cv::FONT_HERSHEY_SIMPLEX,
                                            kFontScale, kBoxThickness, &baseline);

        // Above the box when there is room, otherwise just inside its top edge
        int textY = person.bbox.y - kLabelOffset;
        if (textY - textSize.height < 0) {
            textY = std::min(canvas.rows - 1, person.bbox.y + textSize.height + kLabelOffset);
        }
        int textX = std::max(0, std::min(person.bbox.x, canvas.cols - textSize.width));

        cv::putText(canvas, person.label, cv::Point(textX, textY), cv::FONT_HERSHEY_SIMPLEX,
                    kFontScale, color, kBoxThickness);
    }
    return canvas;
}

} // namespace ppeAI
