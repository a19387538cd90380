#include "Config.hpp"
#include "RESTServer.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <opencv2/core.hpp>

namespace fs = std::filesystem;

namespace {

const char* kDefaultConfigPath = "config/ppeAI.json";

// An explicitly named config must exist; the default one may be absent
ppeAI::AppConfig loadConfig(int argc, char** argv) {
    if (argc > 1) {
        std::cout << "Loading configuration from " << argv[1] << std::endl;
        return ppeAI::AppConfig::fromJsonFile(argv[1]);
    }

    if (fs::exists(kDefaultConfigPath)) {
        std::cout << "Loading configuration from " << kDefaultConfigPath << std::endl;
        return ppeAI::AppConfig::fromJsonFile(kDefaultConfigPath);
    }

    std::cout << "No configuration at " << kDefaultConfigPath << ", using built-in defaults" << std::endl;
    return ppeAI::AppConfig();
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::cout << "OpenCV Version: " << CV_VERSION << std::endl;

        ppeAI::AppConfig config = loadConfig(argc, argv);
        config.validate();

        const auto& c = config.compliance;
        std::cout << "Matching thresholds: helmet containment >= " << c.helmetContainmentThreshold
                  << ", vest IoU >= " << c.vestIoUThreshold
                  << ", mask containment >= " << c.maskContainmentThreshold << std::endl;
        std::cout << "Regions: head " << c.headHeightFraction << " of height, face "
                  << c.faceHeightFraction << " x " << c.faceWidthFraction
                  << " centered at " << c.faceCenterFraction << std::endl;

        // Create and start the REST server
        ppeAI::RESTServer server(config);
        server.start();
    }
    catch (const ppeAI::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
