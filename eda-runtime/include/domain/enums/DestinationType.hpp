#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace eda::domain {

/**
 * @brief Вид приёмника выходного события
 *
 * Числовые значения совпадают с C ABI (ffi/eda_core.h).
 */
enum class DestinationType : uint32_t {
    BROKER = 0,
    QUEUE = 1,
    HTTP = 2,
    DISCARD = 3
};

inline bool isKnownDestinationType(uint32_t value) {
    return value <= static_cast<uint32_t>(DestinationType::DISCARD);
}

inline std::string toString(DestinationType type) {
    switch (type) {
        case DestinationType::BROKER: return "BROKER";
        case DestinationType::QUEUE: return "QUEUE";
        case DestinationType::HTTP: return "HTTP";
        case DestinationType::DISCARD: return "DISCARD";
    }
    return "UNKNOWN(" + std::to_string(static_cast<uint32_t>(type)) + ")";
}

/**
 * @brief Разобрать вид приёмника из конфигурации маршрутизации
 *
 * Регистр не важен. "kafka" и "rabbitmq" - синонимы broker и queue.
 *
 * @throws std::invalid_argument для неизвестного значения
 */
inline DestinationType parseDestinationType(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "broker" || lower == "kafka") return DestinationType::BROKER;
    if (lower == "queue" || lower == "rabbitmq") return DestinationType::QUEUE;
    if (lower == "http") return DestinationType::HTTP;
    if (lower == "discard") return DestinationType::DISCARD;
    throw std::invalid_argument("unknown destination type: " + str);
}

} // namespace eda::domain
