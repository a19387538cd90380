#pragma once

#include <cstddef>
#include <vector>
#include <opencv2/core.hpp>
#include "ComplianceTypes.hpp"

namespace ppeAI {

struct Assignment {
    int personId = -1;
    std::size_t detectionIndex = 0;     // index of the PPE item in the input list
    float score = 0.0f;
};

struct MatchResult {
    std::vector<Assignment> assignments;        // at most one per person, ascending personId
    std::vector<std::size_t> unmatched;         // ascending input index
};

// How one PPE category relates an item box to a person box.
class AssignmentStrategy {
public:
    virtual ~AssignmentStrategy() = default;

    virtual float score(const cv::Rect& item, const cv::Rect& person) const = 0;
    virtual float threshold() const = 0;
    virtual const char* name() const = 0;
};

// Assigns every item to the person it scores highest against (score > 0 and
// >= threshold), ties going to the lowest personId. A person keeps only its
// best item: a later item replaces the current one only with a strictly
// higher score, and whichever loses is reported as unmatched.
// persons must be in personId order with personId == position.
MatchResult assignToPersons(const std::vector<Person>& persons,
                            const std::vector<CategoryItem>& items,
                            const AssignmentStrategy& strategy);

} // namespace ppeAI
