#pragma once

#include "settings/EnvReader.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace eda::settings {

/**
 * @brief Настройки движка и загрузки Core
 *
 * Читает из ENV:
 * - EDA_ROUTING_CONFIG (default: пусто - routing.yaml рядом с исполняемым файлом)
 * - EDA_REQUIRE_ROUTING (default: false)
 * - EDA_POLL_TIMEOUT_MS (default: 100)
 * - EDA_MAX_CONSECUTIVE_ERRORS (default: 5)
 * - EDA_FLUSH_TIMEOUT_MS (default: 5000)
 * - EDA_CORE_LIBRARY (default: пусто - встроенный Core)
 * - EDA_RAW_MESSAGE_FALLBACK (default: false)
 */
class RuntimeSettings {
public:
    RuntimeSettings() {
        routingConfig_ = EnvReader::getEnvOrDefault("EDA_ROUTING_CONFIG", "");
        requireRouting_ = EnvReader::getBool("EDA_REQUIRE_ROUTING", false);
        pollTimeoutMs_ = EnvReader::getUnsigned("EDA_POLL_TIMEOUT_MS", 100);
        maxConsecutiveErrors_ = static_cast<uint32_t>(EnvReader::getUnsigned(
            "EDA_MAX_CONSECUTIVE_ERRORS", 5, std::numeric_limits<uint32_t>::max()));
        flushTimeoutMs_ = EnvReader::getUnsigned("EDA_FLUSH_TIMEOUT_MS", 5000);
        coreLibrary_ = EnvReader::getEnvOrDefault("EDA_CORE_LIBRARY", "");
        rawMessageFallback_ = EnvReader::getBool("EDA_RAW_MESSAGE_FALLBACK", false);
    }

    std::string getRoutingConfig() const { return routingConfig_; }
    bool isRoutingRequired() const { return requireRouting_; }
    uint64_t getPollTimeoutMs() const { return pollTimeoutMs_; }
    uint32_t getMaxConsecutiveErrors() const { return maxConsecutiveErrors_; }
    uint64_t getFlushTimeoutMs() const { return flushTimeoutMs_; }
    std::string getCoreLibrary() const { return coreLibrary_; }
    bool isRawMessageFallback() const { return rawMessageFallback_; }

private:
    std::string routingConfig_;
    bool requireRouting_;
    uint64_t pollTimeoutMs_;
    uint32_t maxConsecutiveErrors_;
    uint64_t flushTimeoutMs_;
    std::string coreLibrary_;
    bool rawMessageFallback_;
};

} // namespace eda::settings
