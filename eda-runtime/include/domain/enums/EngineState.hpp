#pragma once

#include <string>

namespace eda::domain {

/**
 * @brief Состояния движка диспетчеризации
 *
 * CREATED -> CONFIGURED -> SUBSCRIBED -> RUNNING -> DRAINING -> CLOSED
 * FAILED достижимо из CREATED, CONFIGURED и SUBSCRIBED.
 */
enum class EngineState {
    CREATED,
    CONFIGURED,
    SUBSCRIBED,
    RUNNING,
    DRAINING,
    CLOSED,
    FAILED
};

inline std::string toString(EngineState state) {
    switch (state) {
        case EngineState::CREATED: return "CREATED";
        case EngineState::CONFIGURED: return "CONFIGURED";
        case EngineState::SUBSCRIBED: return "SUBSCRIBED";
        case EngineState::RUNNING: return "RUNNING";
        case EngineState::DRAINING: return "DRAINING";
        case EngineState::CLOSED: return "CLOSED";
        case EngineState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace eda::domain
