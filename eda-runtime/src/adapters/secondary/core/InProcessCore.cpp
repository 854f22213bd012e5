#include "adapters/secondary/core/InProcessCore.hpp"

#include "adapters/secondary/core/RoutingConfigLoader.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace eda::adapters::secondary {

using domain::CoreError;

InProcessCore::InProcessCore(std::shared_ptr<settings::ConnectionSettings> settings)
    : settings_(std::move(settings))
    , table_(std::make_shared<domain::routing::RoutingTable>(builtInDefaultDestination()))
{
    if (!settings_) {
        throw CoreError("connection settings are required");
    }
}

domain::ConnectionConfig InProcessCore::getConnectionConfig() {
    ensureOpen("getConnectionConfig");
    return domain::ConnectionConfig(settings_->getBroker(), settings_->getTopic(), settings_->getGroup());
}

bool InProcessCore::shouldRetry(const std::string&, uint32_t) {
    ensureOpen("shouldRetry");
    return false;
}

uint64_t InProcessCore::calculateBackoff(uint32_t) {
    ensureOpen("calculateBackoff");
    return 0;
}

domain::OutputDestination InProcessCore::getOutputDestination(const std::string& eventJson) {
    ensureOpen("getOutputDestination");

    nlohmann::json json = nlohmann::json::parse(eventJson, nullptr, false);
    if (json.is_discarded()) {
        throw CoreError("event envelope is not valid JSON");
    }

    domain::Event event;
    try {
        event = domain::Event::fromJson(json);
    } catch (const std::exception& e) {
        throw CoreError(std::string("event envelope is not a CloudEvent: ") + e.what());
    }

    return routingTable()->resolve(event);
}

void InProcessCore::loadRoutingConfig(const std::string& path) {
    ensureOpen("loadRoutingConfig");

    std::shared_ptr<const domain::routing::RoutingTable> table;
    try {
        table = std::make_shared<domain::routing::RoutingTable>(
            RoutingConfigLoader::loadFile(path, builtInDefaultDestination()));
    } catch (const std::exception& e) {
        throw CoreError(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        table_ = table;
    }

    std::cout << "[InProcessCore] Routing table loaded"
              << " rules=" << table->ruleCount()
              << " default_target=" << table->defaultDestination().target << std::endl;
}

void InProcessCore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool InProcessCore::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::shared_ptr<const domain::routing::RoutingTable> InProcessCore::routingTable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

void InProcessCore::ensureOpen(const char* operation) const {
    if (isClosed()) {
        throw CoreError(std::string("core is closed: ") + operation);
    }
}

} // namespace eda::adapters::secondary
