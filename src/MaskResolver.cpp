#include "MaskResolver.hpp"
#include "Geometry.hpp"

namespace ppeAI {

FaceMatcher::FaceMatcher(const ComplianceConfig& config)
    : threshold_(config.maskContainmentThreshold),
      faceHeightFraction_(config.faceHeightFraction),
      faceWidthFraction_(config.faceWidthFraction),
      faceCenterFraction_(config.faceCenterFraction) {}

float FaceMatcher::score(const cv::Rect& mask, const cv::Rect& person) const {
    cv::Rect face = faceRegion(person, faceHeightFraction_, faceWidthFraction_, faceCenterFraction_);
    return containmentFraction(mask, face);
}

MaskResolver::MaskResolver(const ComplianceConfig& config)
    : matcher_(config) {}

MaskResolution MaskResolver::resolve(std::vector<Person>& persons,
                                     const std::vector<CategoryItem>& maskViolations,
                                     const std::vector<CategoryItem>& masks) const {
    MaskResolution resolution;
    resolution.positives = assignToPersons(persons, masks, matcher_);
    resolution.violations = assignToPersons(persons, maskViolations, matcher_);

    for (const auto& assignment : resolution.positives.assignments) {
        persons[assignment.personId].record.mask = ComplianceStatus::Compliant;
    }
    // Applied last so a violation overrides positive evidence
    for (const auto& assignment : resolution.violations.assignments) {
        persons[assignment.personId].record.mask = ComplianceStatus::Violation;
    }

    return resolution;
}

} // namespace ppeAI
