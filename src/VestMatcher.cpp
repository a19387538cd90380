#include "VestMatcher.hpp"
#include "Geometry.hpp"

namespace ppeAI {

VestMatcher::VestMatcher(const ComplianceConfig& config)
    : threshold_(config.vestIoUThreshold) {}

float VestMatcher::score(const cv::Rect& vest, const cv::Rect& person) const {
    return calculateIoU(vest, person);
}

MatchResult VestMatcher::apply(std::vector<Person>& persons,
                               const std::vector<CategoryItem>& vests) const {
    MatchResult result = assignToPersons(persons, vests, *this);
    for (const auto& assignment : result.assignments) {
        persons[assignment.personId].record.vest = ComplianceStatus::Compliant;
    }
    return result;
}

} // namespace ppeAI
