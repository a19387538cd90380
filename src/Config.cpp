#include "Config.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace ppeAI {

namespace {

template <typename T>
void try_get(const json& node, const char* key, T& value) {
    if (node.is_object() && node.contains(key)) {
        value = node.at(key).get<T>();
    }
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (root.contains(key)) {
        if (!root.at(key).is_object()) {
            throw ConfigError(std::string("config section '") + key + "' must be an object");
        }
        return root.at(key);
    }
    return empty;
}

void requireRange(const char* name, float value, float low, float high, bool lowInclusive) {
    bool aboveLow = lowInclusive ? value >= low : value > low;
    if (!(aboveLow && value <= high)) {
        std::ostringstream msg;
        msg << name << " must be within " << (lowInclusive ? "[" : "(") << low << ", " << high
            << "], got " << value;
        throw ConfigError(msg.str());
    }
}

void requireRange(const char* name, int value, int low, int high) {
    if (value < low || value > high) {
        std::ostringstream msg;
        msg << name << " must be within [" << low << ", " << high << "], got " << value;
        throw ConfigError(msg.str());
    }
}

} // namespace

void ComplianceConfig::validate() const {
    requireRange("helmet_containment_threshold", helmetContainmentThreshold, 0.0f, 1.0f, true);
    requireRange("vest_iou_threshold", vestIoUThreshold, 0.0f, 1.0f, true);
    requireRange("mask_containment_threshold", maskContainmentThreshold, 0.0f, 1.0f, true);

    requireRange("head_height_fraction", headHeightFraction, 0.0f, 1.0f, false);
    requireRange("face_height_fraction", faceHeightFraction, 0.0f, 1.0f, false);
    requireRange("face_width_fraction", faceWidthFraction, 0.0f, 1.0f, false);
    requireRange("face_center_fraction", faceCenterFraction, 0.0f, 1.0f, true);

    requireRange("risk_low_min_score", riskLowMinScore, 0, 100);
    requireRange("risk_medium_min_score", riskMediumMinScore, 0, riskLowMinScore);

    for (const auto& label : ignoredLabels) {
        if (label.empty()) {
            throw ConfigError("ignored labels must not be empty strings");
        }
    }
}

void ServerConfig::validate() const {
    if (host.empty()) {
        throw ConfigError("server host must not be empty");
    }
    requireRange("port", port, 1, 65535);
    requireRange("jpeg_quality", jpegQuality, 1, 100);
}

void AppConfig::validate() const {
    server.validate();
    compliance.validate();
}

json AppConfig::toJson() const {
    json root;
    root["server"] = {
        {"host", server.host},
        {"port", server.port}
    };
    root["matching"] = {
        {"helmet_containment_threshold", compliance.helmetContainmentThreshold},
        {"vest_iou_threshold", compliance.vestIoUThreshold},
        {"mask_containment_threshold", compliance.maskContainmentThreshold}
    };
    root["regions"] = {
        {"head_height_fraction", compliance.headHeightFraction},
        {"face_height_fraction", compliance.faceHeightFraction},
        {"face_width_fraction", compliance.faceWidthFraction},
        {"face_center_fraction", compliance.faceCenterFraction}
    };
    root["scoring"] = {
        {"risk_low_min_score", compliance.riskLowMinScore},
        {"risk_medium_min_score", compliance.riskMediumMinScore}
    };
    root["labels"] = {
        {"ignored", compliance.ignoredLabels}
    };
    root["annotation"] = {
        {"jpeg_quality", server.jpegQuality}
    };
    return root;
}

AppConfig AppConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    AppConfig c;
    try {
        const json& server = section(root, "server");
        try_get(server, "host", c.server.host);
        try_get(server, "port", c.server.port);

        const json& matching = section(root, "matching");
        try_get(matching, "helmet_containment_threshold", c.compliance.helmetContainmentThreshold);
        try_get(matching, "vest_iou_threshold", c.compliance.vestIoUThreshold);
        try_get(matching, "mask_containment_threshold", c.compliance.maskContainmentThreshold);

        const json& regions = section(root, "regions");
        try_get(regions, "head_height_fraction", c.compliance.headHeightFraction);
        try_get(regions, "face_height_fraction", c.compliance.faceHeightFraction);
        try_get(regions, "face_width_fraction", c.compliance.faceWidthFraction);
        try_get(regions, "face_center_fraction", c.compliance.faceCenterFraction);

        const json& scoring = section(root, "scoring");
        try_get(scoring, "risk_low_min_score", c.compliance.riskLowMinScore);
        try_get(scoring, "risk_medium_min_score", c.compliance.riskMediumMinScore);

        const json& labels = section(root, "labels");
        try_get(labels, "ignored", c.compliance.ignoredLabels);

        const json& annotation = section(root, "annotation");
        try_get(annotation, "jpeg_quality", c.server.jpegQuality);
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
    return c;
}

AppConfig AppConfig::fromJsonFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw ConfigError("failed to open config file: " + path);
    }

    json root;
    try {
        ifs >> root;
    }
    catch (const json::parse_error& e) {
        throw ConfigError("failed to parse config file " + path + ": " + e.what());
    }
    return fromJson(root);
}

} // namespace ppeAI
