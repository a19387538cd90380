#include "ComplianceAggregator.hpp"

namespace ppeAI {

namespace {

void count(CategoryCounts& counts, ComplianceStatus status) {
    if (status == ComplianceStatus::Compliant) {
        counts.wearing++;
    } else {
        counts.notWearing++;
    }
}

} // namespace

ComplianceAggregator::ComplianceAggregator(const ComplianceConfig& config)
    : riskLowMinScore_(config.riskLowMinScore),
      riskMediumMinScore_(config.riskMediumMinScore) {}

ComplianceSummary ComplianceAggregator::summarize(const std::vector<Person>& persons) const {
    ComplianceSummary summary;
    summary.total = static_cast<int>(persons.size());

    for (const auto& person : persons) {
        count(summary.helmet, person.record.helmet);
        count(summary.vest, person.record.vest);
        count(summary.mask, person.record.mask);
    }

    // Integer percent of satisfied (person, category) pairs, rounded down
    if (summary.total > 0) {
        int satisfied = summary.helmet.wearing + summary.vest.wearing + summary.mask.wearing;
        summary.complianceScore = satisfied * 100 / (3 * summary.total);
    }

    summary.risk = riskLevel(summary.complianceScore);
    summary.recommendation = recommendation(summary.risk);
    return summary;
}

std::vector<PersonReport> ComplianceAggregator::reportPersons(const std::vector<Person>& persons) const {
    std::vector<PersonReport> reports;
    reports.reserve(persons.size());

    for (const auto& person : persons) {
        PersonReport report;
        report.personId = person.personId;
        report.detectionIndex = person.detectionIndex;
        report.bbox = person.bbox;
        report.record = person.record;
        report.color = overallColor(person.record);
        report.compliancePercent = compliancePercent(person.record);
        report.label = std::string(report.color == AnnotationColor::Green ? "SAFE" : "UNSAFE") +
                       " | " + std::to_string(report.compliancePercent) + "%";
        reports.push_back(report);
    }
    return reports;
}

RiskLevel ComplianceAggregator::riskLevel(int complianceScore) const {
    if (complianceScore >= riskLowMinScore_) {
        return RiskLevel::Low;
    }
    if (complianceScore >= riskMediumMinScore_) {
        return RiskLevel::Medium;
    }
    return RiskLevel::High;
}

AnnotationColor ComplianceAggregator::overallColor(const ComplianceRecord& record) {
    return record.isFullyCompliant() ? AnnotationColor::Green : AnnotationColor::Red;
}

int ComplianceAggregator::compliancePercent(const ComplianceRecord& record) {
    return record.compliantCount() * 100 / 3;
}

std::string ComplianceAggregator::recommendation(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:
            return "Site is compliant. Maintain existing safety protocols.";
        case RiskLevel::Medium:
            return "Partial compliance detected. Increase supervision and PPE enforcement.";
        case RiskLevel::High:
            break;
    }
    return "Critical safety risk identified. Immediate corrective action required.";
}

} // namespace ppeAI
