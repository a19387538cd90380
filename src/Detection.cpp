#include "Detection.hpp"
#include <cctype>
#include <unordered_map>

namespace ppeAI {

MalformedDetectionError::MalformedDetectionError(std::size_t index, const std::string& reason)
    : std::runtime_error("detection " + std::to_string(index) + ": " + reason), index_(index) {}

std::string normalizeLabel(const std::string& label) {
    std::string normalized;
    normalized.reserve(label.size());
    for (char c : label) {
        if (c == '-' || c == '_' || c == ' ') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

std::optional<DetectionCategory> categoryForLabel(const std::string& normalizedLabel) {
    // Class names used by the common hard-hat / safety-vest PPE models
    static const std::unordered_map<std::string, DetectionCategory> aliases = {
        {"person", DetectionCategory::Person},
        {"hardhat", DetectionCategory::Helmet},
        {"helmet", DetectionCategory::Helmet},
        {"safetyvest", DetectionCategory::Vest},
        {"vest", DetectionCategory::Vest},
        {"nomask", DetectionCategory::MaskViolation},
        {"mask", DetectionCategory::Mask},
    };

    auto it = aliases.find(normalizedLabel);
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* toString(DetectionCategory category) {
    switch (category) {
        case DetectionCategory::Person: return "person";
        case DetectionCategory::Helmet: return "helmet";
        case DetectionCategory::Vest: return "vest";
        case DetectionCategory::MaskViolation: return "mask_violation";
        case DetectionCategory::Mask: return "mask";
        case DetectionCategory::Ignored: return "ignored";
    }
    return "unknown";
}

} // namespace ppeAI
