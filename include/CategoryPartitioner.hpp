#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include <opencv2/core.hpp>
#include "ComplianceTypes.hpp"
#include "Config.hpp"
#include "Detection.hpp"

namespace ppeAI {

struct PartitionedDetections {
    std::vector<Person> persons;                // sorted, personId == position
    std::vector<CategoryItem> helmets;          // input order
    std::vector<CategoryItem> vests;
    std::vector<CategoryItem> maskViolations;
    std::vector<CategoryItem> masks;

    int ignoredCount = 0;
    int malformedCount = 0;
};

class CategoryPartitioner {
public:
    explicit CategoryPartitioner(const ComplianceConfig& config);

    // Splits detections into per-category groups. Malformed detections are
    // dropped and counted, never fatal. imageSize is optional; when given,
    // boxes reaching outside the image are malformed.
    PartitionedDetections partition(const std::vector<Detection>& detections,
                                    const cv::Size& imageSize = cv::Size()) const;

    // Throws MalformedDetectionError for an unusable detection
    DetectionCategory classify(std::size_t index, const Detection& detection,
                               const cv::Size& imageSize) const;

private:
    std::unordered_set<std::string> ignoredLabels_;
};

} // namespace ppeAI
