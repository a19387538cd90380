#include "AssignmentMatcher.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

namespace ppeAI {

MatchResult assignToPersons(const std::vector<Person>& persons,
                            const std::vector<CategoryItem>& items,
                            const AssignmentStrategy& strategy) {
    for (std::size_t p = 0; p < persons.size(); ++p) {
        if (persons[p].personId != static_cast<int>(p)) {
            throw std::invalid_argument(std::string(strategy.name()) +
                                        " matcher: persons are not in personId order");
        }
    }

    MatchResult result;
    std::vector<std::optional<Assignment>> best(persons.size());
    const float threshold = strategy.threshold();

    for (const CategoryItem& item : items) {
        int candidate = -1;
        float candidateScore = 0.0f;

        for (const Person& person : persons) {
            float s = strategy.score(item.bbox, person.bbox);
            if (s <= 0.0f || s < threshold) {
                continue;
            }
            // Strict comparison keeps the lowest personId on ties
            if (candidate < 0 || s > candidateScore) {
                candidate = person.personId;
                candidateScore = s;
            }
        }

        if (candidate < 0) {
            result.unmatched.push_back(item.detectionIndex);
            continue;
        }

        auto& slot = best[candidate];
        if (slot && slot->score >= candidateScore) {
            result.unmatched.push_back(item.detectionIndex);
            continue;
        }
        if (slot) {
            result.unmatched.push_back(slot->detectionIndex);
        }
        slot = Assignment{candidate, item.detectionIndex, candidateScore};
    }

    for (const auto& slot : best) {
        if (slot) {
            result.assignments.push_back(*slot);
        }
    }
    std::sort(result.unmatched.begin(), result.unmatched.end());

    return result;
}

} // namespace ppeAI
