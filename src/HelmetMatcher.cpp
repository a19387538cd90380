#include "HelmetMatcher.hpp"
#include "Geometry.hpp"

namespace ppeAI {

HelmetMatcher::HelmetMatcher(const ComplianceConfig& config)
    : threshold_(config.helmetContainmentThreshold),
      headHeightFraction_(config.headHeightFraction) {}

float HelmetMatcher::score(const cv::Rect& helmet, const cv::Rect& person) const {
    return containmentFraction(helmet, headRegion(person, headHeightFraction_));
}

MatchResult HelmetMatcher::apply(std::vector<Person>& persons,
                                 const std::vector<CategoryItem>& helmets) const {
    MatchResult result = assignToPersons(persons, helmets, *this);
    for (const auto& assignment : result.assignments) {
        persons[assignment.personId].record.helmet = ComplianceStatus::Compliant;
    }
    return result;
}

} // namespace ppeAI
