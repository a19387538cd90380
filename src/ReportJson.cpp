#include "ReportJson.hpp"
#include "Geometry.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace ppeAI {

namespace {

int coordinate(const json& bbox, const char* key) {
    if (!bbox.contains(key) || !bbox.at(key).is_number()) {
        throw std::invalid_argument(std::string("bbox field '") + key + "' missing or not a number");
    }
    double value = bbox.at(key).get<double>();
    if (!(std::fabs(value) <= kMaxCoordinate)) {
        throw std::invalid_argument(std::string("bbox field '") + key + "' out of range");
    }
    return static_cast<int>(std::lround(value));
}

json countsToJson(const CategoryCounts& counts) {
    return {
        {"wearing", counts.wearing},
        {"not_wearing", counts.notWearing}
    };
}

} // namespace

Detection detectionFromJson(const json& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("detection must be a JSON object");
    }
    if (!value.contains("class_name") || !value.at("class_name").is_string()) {
        throw std::invalid_argument("detection field 'class_name' missing or not a string");
    }
    if (!value.contains("confidence") || !value.at("confidence").is_number()) {
        throw std::invalid_argument("detection field 'confidence' missing or not a number");
    }
    if (!value.contains("bbox") || !value.at("bbox").is_object()) {
        throw std::invalid_argument("detection field 'bbox' missing or not an object");
    }

    Detection det;
    det.className = value.at("class_name").get<std::string>();
    det.confidence = value.at("confidence").get<float>();

    const json& bbox = value.at("bbox");
    if (bbox.contains("x1")) {
        det.bbox = rectFromCorners(coordinate(bbox, "x1"), coordinate(bbox, "y1"),
                                   coordinate(bbox, "x2"), coordinate(bbox, "y2"));
    } else {
        det.bbox = cv::Rect(coordinate(bbox, "x"), coordinate(bbox, "y"),
                            coordinate(bbox, "width"), coordinate(bbox, "height"));
    }
    return det;
}

std::vector<Detection> detectionsFromJson(const json& array) {
    if (!array.is_array()) {
        throw std::invalid_argument("'detections' must be an array");
    }

    std::vector<Detection> detections;
    detections.reserve(array.size());
    for (std::size_t i = 0; i < array.size(); ++i) {
        try {
            detections.push_back(detectionFromJson(array[i]));
        }
        catch (const std::invalid_argument& e) {
            throw std::invalid_argument("detection " + std::to_string(i) + ": " + e.what());
        }
    }
    return detections;
}

json boxToJson(const cv::Rect& box) {
    return {
        {"x1", box.x},
        {"y1", box.y},
        {"x2", box.x + box.width},
        {"y2", box.y + box.height}
    };
}

json summaryToJson(const ComplianceSummary& summary) {
    json result;
    result["total"] = summary.total;
    result["helmet"] = countsToJson(summary.helmet);
    result["vest"] = countsToJson(summary.vest);
    result["mask"] = countsToJson(summary.mask);
    result["compliance"] = summary.complianceScore;
    result["risk"] = toString(summary.risk);
    result["recommendation"] = summary.recommendation;
    return result;
}

json personToJson(const PersonReport& person) {
    json result;
    result["person_id"] = person.personId;
    result["detection_index"] = person.detectionIndex;
    result["bbox"] = boxToJson(person.bbox);
    result["color"] = toString(person.color);
    result["helmet"] = toString(person.record.helmet);
    result["vest"] = toString(person.record.vest);
    result["mask"] = toString(person.record.mask);
    result["compliance_percent"] = person.compliancePercent;
    result["label"] = person.label;
    return result;
}

json reportToJson(const ComplianceReport& report) {
    json persons = json::array();
    for (const auto& person : report.persons) {
        persons.push_back(personToJson(person));
    }

    json diagnostics;
    diagnostics["malformed"] = report.diagnostics.malformed;
    diagnostics["ignored"] = report.diagnostics.ignored;
    diagnostics["unmatched"] = {
        {"helmet", report.diagnostics.unmatchedHelmets},
        {"vest", report.diagnostics.unmatchedVests},
        {"mask_violation", report.diagnostics.unmatchedMaskViolations},
        {"mask", report.diagnostics.unmatchedMasks}
    };

    json result;
    result["summary"] = summaryToJson(report.summary);
    result["persons"] = persons;
    result["diagnostics"] = diagnostics;
    return result;
}

} // namespace ppeAI
