#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace ppeAI {

enum class ComplianceStatus {
    Compliant,
    Violation
};

// No matching PPE evidence counts as a violation; there is no "unknown" state.
constexpr ComplianceStatus kDefaultComplianceStatus = ComplianceStatus::Violation;

struct ComplianceRecord {
    ComplianceStatus helmet = kDefaultComplianceStatus;
    ComplianceStatus vest = kDefaultComplianceStatus;
    ComplianceStatus mask = kDefaultComplianceStatus;

    int compliantCount() const;
    bool isFullyCompliant() const { return compliantCount() == 3; }
};

// A person detection. personId is its position in the deterministic
// (top, left, input order) ordering and doubles as its index in the
// partitioned person list.
struct Person {
    int personId = -1;
    std::size_t detectionIndex = 0;
    cv::Rect bbox;
    float confidence = 0.0f;
    ComplianceRecord record;
};

// A PPE detection waiting to be assigned to a person
struct CategoryItem {
    std::size_t detectionIndex = 0;
    cv::Rect bbox;
    float confidence = 0.0f;
};

enum class AnnotationColor {
    Green,
    Red
};

enum class RiskLevel {
    Low,
    Medium,
    High
};

struct CategoryCounts {
    int wearing = 0;
    int notWearing = 0;
};

struct ComplianceSummary {
    int total = 0;
    CategoryCounts helmet;
    CategoryCounts vest;
    CategoryCounts mask;

    int complianceScore = 0;    // percent of satisfied (person, category) pairs
    RiskLevel risk = RiskLevel::High;
    std::string recommendation;
};

// Everything the rendering side needs to draw one person
struct PersonReport {
    int personId = -1;
    std::size_t detectionIndex = 0;
    cv::Rect bbox;
    AnnotationColor color = AnnotationColor::Red;
    ComplianceRecord record;
    int compliancePercent = 0;
    std::string label;
};

struct MatchDiagnostics {
    int malformed = 0;
    int ignored = 0;

    // Input indices of PPE detections that ended up on nobody
    std::vector<std::size_t> unmatchedHelmets;
    std::vector<std::size_t> unmatchedVests;
    std::vector<std::size_t> unmatchedMaskViolations;
    std::vector<std::size_t> unmatchedMasks;
};

struct ComplianceReport {
    ComplianceSummary summary;
    std::vector<PersonReport> persons;
    MatchDiagnostics diagnostics;
};

const char* toString(ComplianceStatus status);
const char* toString(AnnotationColor color);
const char* toString(RiskLevel level);

} // namespace ppeAI
