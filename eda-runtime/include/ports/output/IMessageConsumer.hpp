#pragma once

#include "domain/BrokerMessage.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace eda::ports::output {

/**
 * @brief Результат одного ожидания сообщения
 */
struct PollResult {
    enum class Status {
        MESSAGE,
        TIMEOUT,
        TRANSPORT_ERROR
    };

    Status status = Status::TIMEOUT;
    std::optional<domain::BrokerMessage> message;
    std::string error;

    static PollResult received(domain::BrokerMessage message) {
        PollResult result;
        result.status = Status::MESSAGE;
        result.message = std::move(message);
        return result;
    }

    static PollResult timeout() {
        return PollResult();
    }

    static PollResult transportError(std::string error) {
        PollResult result;
        result.status = Status::TRANSPORT_ERROR;
        result.error = std::move(error);
        return result;
    }
};

/**
 * @brief Входящее соединение с брокером
 *
 * Блокирующий примитив "получить следующее сообщение с таймаутом".
 * Вызывается только из потока движка.
 */
class IMessageConsumer {
public:
    virtual ~IMessageConsumer() = default;

    /**
     * @brief Подписаться на топик
     *
     * При каждом (пере)назначении чтение начинается с самого раннего сообщения.
     *
     * @throws domain::TransportError если брокер недоступен
     */
    virtual void subscribe(const std::string& topic, const std::string& group) = 0;

    /**
     * @brief Дождаться сообщения не дольше timeout
     */
    virtual PollResult poll(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

} // namespace eda::ports::output
