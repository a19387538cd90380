#pragma once

#include <string>
#include <vector>
#include "ComplianceTypes.hpp"
#include "Config.hpp"

namespace ppeAI {

// Pure reduction over finished compliance records; never mutates them.
class ComplianceAggregator {
public:
    explicit ComplianceAggregator(const ComplianceConfig& config);

    ComplianceSummary summarize(const std::vector<Person>& persons) const;
    std::vector<PersonReport> reportPersons(const std::vector<Person>& persons) const;

    RiskLevel riskLevel(int complianceScore) const;

    static AnnotationColor overallColor(const ComplianceRecord& record);
    static int compliancePercent(const ComplianceRecord& record);
    static std::string recommendation(RiskLevel level);

private:
    int riskLowMinScore_;
    int riskMediumMinScore_;
};

} // namespace ppeAI
