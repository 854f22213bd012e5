#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace eda::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать сообщение
     * @param target Топик/ключ маршрутизации (например, "order.processed")
     * @param key Ключ сообщения (id события)
     * @param message JSON-сообщение
     * @param cluster Кластер назначения, если задан
     * @throws domain::TransportError при ошибке публикации
     */
    virtual void publish(const std::string& target,
                         const std::string& key,
                         const std::string& message,
                         const std::optional<std::string>& cluster) = 0;

    /**
     * @brief Дождаться отправки всех сообщений
     * @return false, если за timeout отправлено не всё
     */
    virtual bool flush(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

} // namespace eda::ports::output
