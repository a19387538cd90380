#include "CompliancePipeline.hpp"
#include "CategoryPartitioner.hpp"
#include "ComplianceAggregator.hpp"
#include "HelmetMatcher.hpp"
#include "MaskResolver.hpp"
#include "VestMatcher.hpp"
#include <iostream>
#include <utility>

namespace ppeAI {

namespace {

const ComplianceConfig& validated(const ComplianceConfig& config) {
    config.validate();
    return config;
}

} // namespace

class CompliancePipeline::Impl {
public:
    explicit Impl(const ComplianceConfig& cfg)
        : config(validated(cfg)),
          partitioner(config),
          helmetMatcher(config),
          vestMatcher(config),
          maskResolver(config),
          aggregator(config) {}

    ComplianceConfig config;
    CategoryPartitioner partitioner;
    HelmetMatcher helmetMatcher;
    VestMatcher vestMatcher;
    MaskResolver maskResolver;
    ComplianceAggregator aggregator;
};

CompliancePipeline::CompliancePipeline(const ComplianceConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

CompliancePipeline::~CompliancePipeline() = default;

const ComplianceConfig& CompliancePipeline::config() const {
    return pImpl_->config;
}

ComplianceReport CompliancePipeline::analyze(const std::vector<Detection>& detections,
                                             const cv::Size& imageSize) const {
    PartitionedDetections groups = pImpl_->partitioner.partition(detections, imageSize);

    if (groups.persons.empty()) {
        std::cout << "No persons detected among " << detections.size()
                  << " detection(s); reporting an empty summary" << std::endl;
    }

    MatchResult helmets = pImpl_->helmetMatcher.apply(groups.persons, groups.helmets);
    MatchResult vests = pImpl_->vestMatcher.apply(groups.persons, groups.vests);
    MaskResolution masks = pImpl_->maskResolver.resolve(groups.persons, groups.maskViolations, groups.masks);

    ComplianceReport report;
    report.summary = pImpl_->aggregator.summarize(groups.persons);
    report.persons = pImpl_->aggregator.reportPersons(groups.persons);

    report.diagnostics.malformed = groups.malformedCount;
    report.diagnostics.ignored = groups.ignoredCount;
    report.diagnostics.unmatchedHelmets = std::move(helmets.unmatched);
    report.diagnostics.unmatchedVests = std::move(vests.unmatched);
    report.diagnostics.unmatchedMaskViolations = std::move(masks.violations.unmatched);
    report.diagnostics.unmatchedMasks = std::move(masks.positives.unmatched);

    return report;
}

} // namespace ppeAI
