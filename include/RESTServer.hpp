#pragma once

#include <memory>
#include "Config.hpp"

namespace ppeAI {

class RESTServer {
public:
    // Builds the compliance pipeline up front; throws ConfigError when the
    // configuration is invalid.
    explicit RESTServer(const AppConfig& config);
    ~RESTServer();

    // Blocks serving requests until stop() is called
    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ppeAI
