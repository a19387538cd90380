#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "ComplianceTypes.hpp"
#include "Detection.hpp"

namespace ppeAI {

// Parses one detection:
//   {"class_name": "person", "confidence": 0.9, "class_id": 0,
//    "bbox": {"x1": .., "y1": .., "x2": .., "y2": ..}}
// bbox may also be {"x", "y", "width", "height"}. class_id and any other
// extra keys are accepted and ignored; the label alone decides the category.
// Coordinates beyond +/-kMaxCoordinate are rejected.
// Throws std::invalid_argument for missing or wrongly typed fields. Box
// geometry is not checked here; that is the partitioner's job.
Detection detectionFromJson(const nlohmann::json& value);
std::vector<Detection> detectionsFromJson(const nlohmann::json& array);

nlohmann::json boxToJson(const cv::Rect& box);
nlohmann::json summaryToJson(const ComplianceSummary& summary);
nlohmann::json personToJson(const PersonReport& person);
nlohmann::json reportToJson(const ComplianceReport& report);

} // namespace ppeAI
