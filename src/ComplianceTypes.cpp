#include "ComplianceTypes.hpp"
#include <initializer_list>

namespace ppeAI {

int ComplianceRecord::compliantCount() const {
    int count = 0;
    for (ComplianceStatus status : {helmet, vest, mask}) {
        if (status == ComplianceStatus::Compliant) {
            count++;
        }
    }
    return count;
}

const char* toString(ComplianceStatus status) {
    return status == ComplianceStatus::Compliant ? "compliant" : "violation";
}

const char* toString(AnnotationColor color) {
    return color == AnnotationColor::Green ? "GREEN" : "RED";
}

const char* toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "LOW";
        case RiskLevel::Medium: return "MEDIUM";
        case RiskLevel::High: return "HIGH";
    }
    return "HIGH";
}

} // namespace ppeAI
