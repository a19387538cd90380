#pragma once

#include <vector>
#include "AssignmentMatcher.hpp"
#include "Config.hpp"

namespace ppeAI {

// Scores a mask-class box by its containment in the person's face region.
// Shared by the "no mask" and "mask" classes.
class FaceMatcher : public AssignmentStrategy {
public:
    explicit FaceMatcher(const ComplianceConfig& config);

    float score(const cv::Rect& mask, const cv::Rect& person) const override;
    float threshold() const override { return threshold_; }
    const char* name() const override { return "mask"; }

private:
    float threshold_;
    float faceHeightFraction_;
    float faceWidthFraction_;
    float faceCenterFraction_;
};

struct MaskResolution {
    MatchResult violations;     // "no mask" detections
    MatchResult positives;      // "mask" detections
};

class MaskResolver {
public:
    explicit MaskResolver(const ComplianceConfig& config);

    // A matched violation always sets mask = Violation, even when the same
    // person also carries positive mask evidence. Persons with neither keep
    // the default status.
    MaskResolution resolve(std::vector<Person>& persons,
                           const std::vector<CategoryItem>& maskViolations,
                           const std::vector<CategoryItem>& masks) const;

private:
    FaceMatcher matcher_;
};

} // namespace ppeAI
