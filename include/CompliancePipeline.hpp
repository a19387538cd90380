#pragma once

#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "ComplianceTypes.hpp"
#include "Config.hpp"
#include "Detection.hpp"

namespace ppeAI {

// Partition -> helmet / vest / mask matching -> aggregation, for one image.
// analyze() keeps all state on the stack, so one pipeline can serve
// concurrent requests.
class CompliancePipeline {
public:
    // Throws ConfigError if the configuration is invalid
    explicit CompliancePipeline(const ComplianceConfig& config);
    ~CompliancePipeline();

    CompliancePipeline(const CompliancePipeline&) = delete;
    CompliancePipeline& operator=(const CompliancePipeline&) = delete;

    ComplianceReport analyze(const std::vector<Detection>& detections,
                             const cv::Size& imageSize = cv::Size()) const;

    const ComplianceConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ppeAI
