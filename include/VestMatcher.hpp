#pragma once

#include <vector>
#include "AssignmentMatcher.hpp"
#include "Config.hpp"

namespace ppeAI {

// Vests cover the torso, so they are scored by IoU against the whole person
// box; the default threshold sits below a usual NMS merge threshold.
class VestMatcher : public AssignmentStrategy {
public:
    explicit VestMatcher(const ComplianceConfig& config);

    float score(const cv::Rect& vest, const cv::Rect& person) const override;
    float threshold() const override { return threshold_; }
    const char* name() const override { return "vest"; }

    MatchResult apply(std::vector<Person>& persons, const std::vector<CategoryItem>& vests) const;

private:
    float threshold_;
};

} // namespace ppeAI
