#include "CategoryPartitioner.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace ppeAI;
using ppeAI::test::makeDetection;

class CategoryPartitionerTest : public ::testing::Test {
protected:
    ComplianceConfig config_;
};

TEST(LabelTest, NormalizeStripsSeparatorsAndCase) {
    EXPECT_EQ(normalizeLabel("Safety Vest"), "safetyvest");
    EXPECT_EQ(normalizeLabel("NO-Mask"), "nomask");
    EXPECT_EQ(normalizeLabel("hard_hat"), "hardhat");
}

TEST(LabelTest, AliasesMapOntoCategories) {
    EXPECT_EQ(categoryForLabel("person").value(), DetectionCategory::Person);
    EXPECT_EQ(categoryForLabel("hardhat").value(), DetectionCategory::Helmet);
    EXPECT_EQ(categoryForLabel("helmet").value(), DetectionCategory::Helmet);
    EXPECT_EQ(categoryForLabel("safetyvest").value(), DetectionCategory::Vest);
    EXPECT_EQ(categoryForLabel("nomask").value(), DetectionCategory::MaskViolation);
    EXPECT_EQ(categoryForLabel("mask").value(), DetectionCategory::Mask);
    EXPECT_FALSE(categoryForLabel("forklift").has_value());
}

TEST_F(CategoryPartitionerTest, SplitsDetectionsByCategory) {
    std::vector<Detection> detections = {
        makeDetection("Person", 0, 0, 100, 200),
        makeDetection("Hardhat", 30, 0, 70, 30),
        makeDetection("Safety Vest", 0, 70, 100, 190),
        makeDetection("NO-Mask", 45, 20, 75, 38),
        makeDetection("Mask", 45, 20, 75, 38),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    ASSERT_EQ(groups.persons.size(), 1u);
    ASSERT_EQ(groups.helmets.size(), 1u);
    ASSERT_EQ(groups.vests.size(), 1u);
    ASSERT_EQ(groups.maskViolations.size(), 1u);
    ASSERT_EQ(groups.masks.size(), 1u);
    EXPECT_EQ(groups.helmets[0].detectionIndex, 1u);
    EXPECT_EQ(groups.vests[0].detectionIndex, 2u);
    EXPECT_EQ(groups.maskViolations[0].detectionIndex, 3u);
    EXPECT_EQ(groups.masks[0].detectionIndex, 4u);
    EXPECT_EQ(groups.ignoredCount, 0);
    EXPECT_EQ(groups.malformedCount, 0);
}

TEST_F(CategoryPartitionerTest, PersonsStartWithDefaultViolations) {
    std::vector<Detection> detections = {makeDetection("person", 0, 0, 100, 200)};

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    ASSERT_EQ(groups.persons.size(), 1u);
    const ComplianceRecord& record = groups.persons[0].record;
    EXPECT_EQ(record.helmet, ComplianceStatus::Violation);
    EXPECT_EQ(record.vest, ComplianceStatus::Violation);
    EXPECT_EQ(record.mask, ComplianceStatus::Violation);
}

TEST_F(CategoryPartitionerTest, PersonsAreOrderedTopThenLeft) {
    std::vector<Detection> detections = {
        makeDetection("person", 300, 50, 400, 250),    // lower
        makeDetection("person", 200, 0, 300, 200),     // top, right
        makeDetection("person", 0, 0, 100, 200),       // top, left
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    ASSERT_EQ(groups.persons.size(), 3u);
    EXPECT_EQ(groups.persons[0].detectionIndex, 2u);
    EXPECT_EQ(groups.persons[1].detectionIndex, 1u);
    EXPECT_EQ(groups.persons[2].detectionIndex, 0u);
    for (std::size_t i = 0; i < groups.persons.size(); ++i) {
        EXPECT_EQ(groups.persons[i].personId, static_cast<int>(i));
    }
}

TEST_F(CategoryPartitionerTest, IdenticalCornersKeepInputOrder) {
    std::vector<Detection> detections = {
        makeDetection("person", 0, 0, 100, 200),
        makeDetection("person", 0, 0, 80, 150),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    ASSERT_EQ(groups.persons.size(), 2u);
    EXPECT_EQ(groups.persons[0].detectionIndex, 0u);
    EXPECT_EQ(groups.persons[1].detectionIndex, 1u);
}

TEST_F(CategoryPartitionerTest, DropsMalformedBoxesAndKeepsTheRest) {
    std::vector<Detection> detections = {
        makeDetection("person", 100, 0, 100, 200),     // zero width
        makeDetection("person", 0, 200, 100, 100),     // inverted
        makeDetection("helmet", 30, 0, 70, 30),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    EXPECT_TRUE(groups.persons.empty());
    EXPECT_EQ(groups.helmets.size(), 1u);
    EXPECT_EQ(groups.malformedCount, 2);
}

TEST_F(CategoryPartitionerTest, UnknownLabelIsMalformed) {
    CategoryPartitioner partitioner(config_);
    Detection det = makeDetection("forklift", 0, 0, 10, 10);

    EXPECT_THROW(partitioner.classify(0, det, cv::Size()), MalformedDetectionError);

    PartitionedDetections groups = partitioner.partition({det});
    EXPECT_EQ(groups.malformedCount, 1);
    EXPECT_EQ(groups.ignoredCount, 0);
}

TEST_F(CategoryPartitionerTest, ConfiguredLabelsAreIgnoredNotMalformed) {
    std::vector<Detection> detections = {
        makeDetection("NO-Hardhat", 0, 0, 10, 10),
        makeDetection("Safety Cone", 0, 0, 10, 10),
        makeDetection("vehicle", 0, 0, 10, 10),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    EXPECT_EQ(groups.ignoredCount, 3);
    EXPECT_EQ(groups.malformedCount, 0);
}

TEST_F(CategoryPartitionerTest, IgnoredLabelsOverrideAliases) {
    config_.ignoredLabels.push_back("Mask");
    std::vector<Detection> detections = {makeDetection("mask", 0, 0, 10, 10)};

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    EXPECT_TRUE(groups.masks.empty());
    EXPECT_EQ(groups.ignoredCount, 1);
}

TEST_F(CategoryPartitionerTest, BoxesOutsideImageAreMalformed) {
    std::vector<Detection> detections = {
        makeDetection("person", 0, 0, 100, 200),
        makeDetection("person", 600, 0, 700, 200),
        makeDetection("person", -5, 0, 50, 100),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections, cv::Size(640, 480));

    EXPECT_EQ(groups.persons.size(), 1u);
    EXPECT_EQ(groups.malformedCount, 2);
}

TEST_F(CategoryPartitionerTest, OversizedCoordinatesAreMalformed) {
    Detection huge = makeDetection("person", 0, 0, 10, 10);
    huge.bbox = cv::Rect(0, 0, kMaxCoordinate + 1, 100);
    Detection farAway = makeDetection("person", 0, 0, 10, 10);
    farAway.bbox = cv::Rect(-kMaxCoordinate - 1, 0, 10, 10);

    PartitionedDetections groups = CategoryPartitioner(config_).partition({huge, farAway});

    EXPECT_TRUE(groups.persons.empty());
    EXPECT_EQ(groups.malformedCount, 2);
}

TEST_F(CategoryPartitionerTest, BoundsAreNotCheckedWithoutImageSize) {
    std::vector<Detection> detections = {makeDetection("person", 600, 0, 700, 200)};

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    EXPECT_EQ(groups.persons.size(), 1u);
}

TEST_F(CategoryPartitionerTest, ConfidenceOutsideUnitRangeIsMalformed) {
    std::vector<Detection> detections = {
        makeDetection("person", 0, 0, 100, 200, 1.5f),
        makeDetection("person", 0, 0, 100, 200, -0.1f),
        makeDetection("person", 0, 0, 100, 200, 1.0f),
    };

    PartitionedDetections groups = CategoryPartitioner(config_).partition(detections);

    EXPECT_EQ(groups.persons.size(), 1u);
    EXPECT_EQ(groups.malformedCount, 2);
}

TEST_F(CategoryPartitionerTest, MalformedErrorCarriesIndex) {
    CategoryPartitioner partitioner(config_);
    try {
        partitioner.classify(7, makeDetection("person", 10, 10, 5, 5), cv::Size());
        FAIL() << "expected MalformedDetectionError";
    }
    catch (const MalformedDetectionError& e) {
        EXPECT_EQ(e.index(), 7u);
        EXPECT_NE(std::string(e.what()).find("detection 7"), std::string::npos);
    }
}
