#pragma once

#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

namespace eda::settings {

/**
 * @brief Чтение переменных окружения с умолчаниями
 *
 * Неверное числовое или логическое значение - domain::ConfigurationError.
 */
class EnvReader {
public:
    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static uint64_t getUnsigned(const char* name, uint64_t defaultValue,
                                uint64_t maxValue = std::numeric_limits<uint64_t>::max()) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return defaultValue;
        }
        std::string text(value);
        if (!std::all_of(text.begin(), text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw domain::ConfigurationError(std::string(name) + " must be a non-negative integer: " + text);
        }
        uint64_t result = 0;
        try {
            result = std::stoull(text);
        } catch (const std::out_of_range&) {
            throw domain::ConfigurationError(std::string(name) + " is out of range: " + text);
        }
        if (result > maxValue) {
            throw domain::ConfigurationError(std::string(name) + " must not exceed "
                                             + std::to_string(maxValue) + ": " + text);
        }
        return result;
    }

    static bool getBool(const char* name, bool defaultValue) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return defaultValue;
        }
        std::string text(value);
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
        if (text == "false" || text == "0" || text == "no" || text == "off") return false;
        throw domain::ConfigurationError(std::string(name) + " must be a boolean: " + value);
    }
};

} // namespace eda::settings
