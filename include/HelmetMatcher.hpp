#pragma once

#include <vector>
#include "AssignmentMatcher.hpp"
#include "Config.hpp"

namespace ppeAI {

// Helmets belong on the head: scored by how much of the helmet box lies in
// the person's head region.
class HelmetMatcher : public AssignmentStrategy {
public:
    explicit HelmetMatcher(const ComplianceConfig& config);

    float score(const cv::Rect& helmet, const cv::Rect& person) const override;
    float threshold() const override { return threshold_; }
    const char* name() const override { return "helmet"; }

    // Matches helmets and marks assigned persons as helmet-compliant
    MatchResult apply(std::vector<Person>& persons, const std::vector<CategoryItem>& helmets) const;

private:
    float threshold_;
    float headHeightFraction_;
};

} // namespace ppeAI
