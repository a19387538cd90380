#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ppeAI {

// Fatal configuration problem, raised at startup and never per request.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only parameters of the compliance core. One instance is shared by
// every request, so nothing in here may change after validate().
struct ComplianceConfig {
    // Matching thresholds; a score equal to the threshold still matches
    float helmetContainmentThreshold = 0.5f;
    float vestIoUThreshold = 0.3f;
    float maskContainmentThreshold = 0.4f;

    // Derived regions, as fractions of the person box
    float headHeightFraction = 0.35f;
    float faceHeightFraction = 0.20f;
    float faceWidthFraction = 0.5f;
    float faceCenterFraction = 0.6f;

    // Site score bands (percent)
    int riskLowMinScore = 85;
    int riskMediumMinScore = 60;

    // Model classes that are recognized but play no part in matching
    std::vector<std::string> ignoredLabels = {
        "nohardhat", "nosafetyvest", "safetycone", "machinery", "vehicle"
    };

    void validate() const;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int jpegQuality = 90;

    void validate() const;
};

struct AppConfig {
    ServerConfig server;
    ComplianceConfig compliance;

    void validate() const;
    nlohmann::json toJson() const;

    // Missing keys keep their defaults; wrongly typed values throw ConfigError
    static AppConfig fromJson(const nlohmann::json& root);
    static AppConfig fromJsonFile(const std::string& path);
};

} // namespace ppeAI
