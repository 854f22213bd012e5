#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace eda::settings {

/**
 * @brief Параметры подключения, которые отдаёт встроенный Core
 *
 * Читает из ENV:
 * - EDA_BROKER (default: "localhost:5672")
 * - EDA_TOPIC (default: "events")
 * - EDA_GROUP (default: "poc")
 */
class ConnectionSettings {
public:
    ConnectionSettings() {
        broker_ = EnvReader::getEnvOrDefault("EDA_BROKER", "localhost:5672");
        topic_ = EnvReader::getEnvOrDefault("EDA_TOPIC", "events");
        group_ = EnvReader::getEnvOrDefault("EDA_GROUP", "poc");
    }

    std::string getBroker() const { return broker_; }
    std::string getTopic() const { return topic_; }
    std::string getGroup() const { return group_; }

private:
    std::string broker_;
    std::string topic_;
    std::string group_;
};

} // namespace eda::settings
