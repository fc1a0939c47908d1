#include "RouterBootstrap.hpp"
#include "Logger.hpp"

namespace garlic_shell {

ExternalRouter::ExternalRouter(std::string samAddress)
    : sam_address_(std::move(samAddress)) {}

void ExternalRouter::waitReady(std::chrono::milliseconds) {
    // An external router is managed by its operator and assumed up
    Logger::logEvent(LogLevel::Debug, "Using external I2P router at " + sam_address_);
}

void ExternalRouter::shutdown() {
    Logger::logEvent(LogLevel::Debug, "External I2P router left running");
}

} // namespace garlic_shell
