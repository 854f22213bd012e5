#pragma once

#include <stdexcept>
#include <string>

namespace eda::domain {

/**
 * @brief Фатальная ошибка конфигурации/построения движка
 *
 * Неверный handler, недоступная конфигурация подключения,
 * сбой фабрики Core. Останавливает запуск без повторов.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Ошибка транспорта брокера
 *
 * Фатальна при подписке и при срабатывании предохранителя
 * последовательных ошибок чтения.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Сообщение не удалось декодировать в CloudEvent
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Ошибка маршрутизации/публикации одного выходного события
 */
class RoutingError : public std::runtime_error {
public:
    explicit RoutingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Сбой вызова Core
 */
class CoreError : public std::runtime_error {
public:
    explicit CoreError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace eda::domain
