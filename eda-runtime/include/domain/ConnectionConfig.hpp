#pragma once

#include "domain/Errors.hpp"
#include <string>

namespace eda::domain {

/**
 * @brief Параметры подключения к брокеру
 *
 * Запрашивается у Core один раз при старте и не меняется
 * до конца жизни движка.
 */
class ConnectionConfig {
public:
    std::string broker;
    std::string topic;
    std::string group;

    ConnectionConfig() = default;

    ConnectionConfig(std::string broker, std::string topic, std::string group)
        : broker(std::move(broker))
        , topic(std::move(topic))
        , group(std::move(group))
    {}

    /**
     * @brief Проверить инварианты
     * @throws ConfigurationError если broker или topic пусты
     */
    void validate() const {
        if (broker.empty()) {
            throw ConfigurationError("connection config: broker must not be empty");
        }
        if (topic.empty()) {
            throw ConfigurationError("connection config: topic must not be empty");
        }
    }
};

} // namespace eda::domain
