#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace ppeAI {

// Raw detection as delivered by the object-detection collaborator.
// bbox is in source image pixels (top-left corner plus width/height).
struct Detection {
    cv::Rect bbox;
    float confidence = 0.0f;
    std::string className;
};

enum class DetectionCategory {
    Person,
    Helmet,
    Vest,
    MaskViolation,
    Mask,       // positive "wearing mask" evidence
    Ignored
};

class MalformedDetectionError : public std::runtime_error {
public:
    MalformedDetectionError(std::size_t index, const std::string& reason);

    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

// Lower-cases the label and strips '-', '_' and spaces ("Safety Vest" -> "safetyvest")
std::string normalizeLabel(const std::string& label);

// Maps a normalized label onto a PPE category; std::nullopt for labels the
// service does not know about.
std::optional<DetectionCategory> categoryForLabel(const std::string& normalizedLabel);

const char* toString(DetectionCategory category);

} // namespace ppeAI
