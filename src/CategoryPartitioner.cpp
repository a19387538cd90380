#include "CategoryPartitioner.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace ppeAI {

CategoryPartitioner::CategoryPartitioner(const ComplianceConfig& config) {
    for (const auto& label : config.ignoredLabels) {
        ignoredLabels_.insert(normalizeLabel(label));
    }
}

DetectionCategory CategoryPartitioner::classify(std::size_t index, const Detection& detection,
                                                const cv::Size& imageSize) const {
    std::string label = normalizeLabel(detection.className);

    // Ignored labels win over aliases so a class can be switched off from config
    if (ignoredLabels_.count(label) > 0) {
        return DetectionCategory::Ignored;
    }

    auto category = categoryForLabel(label);
    if (!category) {
        throw MalformedDetectionError(index, "unrecognized label '" + detection.className + "'");
    }

    const cv::Rect& box = detection.bbox;
    if (box.width <= 0 || box.height <= 0) {
        throw MalformedDetectionError(index, "box has non-positive width or height");
    }
    if (box.x < -kMaxCoordinate || box.x > kMaxCoordinate ||
        box.y < -kMaxCoordinate || box.y > kMaxCoordinate ||
        box.width > kMaxCoordinate || box.height > kMaxCoordinate) {
        throw MalformedDetectionError(index, "box coordinates out of range");
    }

    if (imageSize.width > 0 && imageSize.height > 0) {
        if (box.x < 0 || box.y < 0 ||
            static_cast<std::int64_t>(box.x) + box.width > imageSize.width ||
            static_cast<std::int64_t>(box.y) + box.height > imageSize.height) {
            throw MalformedDetectionError(index, "box lies outside the image bounds");
        }
    }

    if (!(detection.confidence >= 0.0f && detection.confidence <= 1.0f)) {
        throw MalformedDetectionError(index, "confidence outside [0, 1]");
    }

    return *category;
}

PartitionedDetections CategoryPartitioner::partition(const std::vector<Detection>& detections,
                                                     const cv::Size& imageSize) const {
    PartitionedDetections groups;

    for (std::size_t i = 0; i < detections.size(); ++i) {
        const Detection& det = detections[i];

        DetectionCategory category = DetectionCategory::Ignored;
        try {
            category = classify(i, det, imageSize);
        }
        catch (const MalformedDetectionError& e) {
            std::cerr << "Warning: dropping malformed " << e.what() << std::endl;
            groups.malformedCount++;
            continue;
        }

        CategoryItem item{i, det.bbox, det.confidence};
        switch (category) {
            case DetectionCategory::Person: {
                Person person;
                person.detectionIndex = i;
                person.bbox = det.bbox;
                person.confidence = det.confidence;
                groups.persons.push_back(person);
                break;
            }
            case DetectionCategory::Helmet:
                groups.helmets.push_back(item);
                break;
            case DetectionCategory::Vest:
                groups.vests.push_back(item);
                break;
            case DetectionCategory::MaskViolation:
                groups.maskViolations.push_back(item);
                break;
            case DetectionCategory::Mask:
                groups.masks.push_back(item);
                break;
            case DetectionCategory::Ignored:
                groups.ignoredCount++;
                break;
        }
    }

    // Top-to-bottom, left-to-right; input order settles identical corners
    std::stable_sort(groups.persons.begin(), groups.persons.end(),
                     [](const Person& a, const Person& b) {
                         if (a.bbox.y != b.bbox.y) {
                             return a.bbox.y < b.bbox.y;
                         }
                         return a.bbox.x < b.bbox.x;
                     });

    for (std::size_t i = 0; i < groups.persons.size(); ++i) {
        groups.persons[i].personId = static_cast<int>(i);
    }

    return groups;
}

} // namespace ppeAI
