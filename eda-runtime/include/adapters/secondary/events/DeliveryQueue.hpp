#pragma once

#include "ports/output/IMessageConsumer.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace eda::adapters::secondary {

/**
 * @brief Элемент очереди: результат чтения и тег доставки брокера
 *
 * deliveryTag = 0 - подтверждать нечего (ошибка транспорта).
 */
struct Delivery {
    ports::output::PollResult result;
    uint64_t deliveryTag = 0;
};

/**
 * @brief Потокобезопасная очередь доставок
 *
 * Поток AMQP кладёт сюда полученные сообщения и ошибки транспорта,
 * поток движка забирает их с ограниченным ожиданием.
 * Используются std::mutex и std::condition_variable.
 *
 * После fail() соединение считается потерянным: оставшиеся доставки
 * ещё отдаются, затем каждый popFor() сразу возвращает ту же ошибку.
 */
class DeliveryQueue {
public:
    DeliveryQueue() = default;
    ~DeliveryQueue();

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    /**
     * @brief Добавить результат в очередь
     *
     * После shutdown() или fail() вызов игнорируется.
     */
    void push(ports::output::PollResult item, uint64_t deliveryTag = 0);

    /**
     * @brief Извлечь результат, ожидая не дольше timeout
     * @return std::nullopt по таймауту или если очередь закрыта и пуста;
     *         ошибку транспорта, если очередь пуста после fail()
     */
    std::optional<Delivery> popFor(std::chrono::milliseconds timeout);

    /**
     * @brief Зафиксировать потерю соединения
     *
     * Первая ошибка сохраняется, последующие игнорируются.
     */
    void fail(const std::string& error);

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;

    std::optional<std::string> failure() const;

    size_t size() const;

private:
    std::deque<Delivery> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
    std::optional<std::string> failure_;
};

} // namespace eda::adapters::secondary
