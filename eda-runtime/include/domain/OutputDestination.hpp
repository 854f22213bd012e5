#pragma once

#include "domain/enums/DestinationType.hpp"
#include <optional>
#include <string>

namespace eda::domain {

/**
 * @brief Куда отправить производное событие
 *
 * Возвращается Core для каждого выходного события,
 * используется роутером один раз и не сохраняется.
 */
class OutputDestination {
public:
    DestinationType type = DestinationType::BROKER;
    std::string target;
    std::optional<std::string> cluster;

    OutputDestination() = default;

    OutputDestination(DestinationType type, std::string target,
                      std::optional<std::string> cluster = std::nullopt)
        : type(type)
        , target(std::move(target))
        , cluster(std::move(cluster))
    {}

    static OutputDestination discard() {
        return OutputDestination(DestinationType::DISCARD, "");
    }

    bool operator==(const OutputDestination& other) const {
        return type == other.type && target == other.target && cluster == other.cluster;
    }

    bool operator!=(const OutputDestination& other) const {
        return !(*this == other);
    }
};

} // namespace eda::domain
