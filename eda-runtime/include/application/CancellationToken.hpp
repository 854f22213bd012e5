#pragma once

#include <atomic>
#include <chrono>

namespace eda::application {

/**
 * @brief Кооперативная отмена цикла движка
 *
 * Взводится обработчиком сигнала, другим потоком или по дедлайну.
 * Движок проверяет токен между итерациями цикла.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() noexcept {
        cancelled_.store(true);
    }

    void setDeadline(Clock::time_point deadline) noexcept {
        deadline_.store(deadline.time_since_epoch().count());
        hasDeadline_.store(true);
    }

    bool isCancelled() const noexcept {
        if (cancelled_.load()) {
            return true;
        }
        if (hasDeadline_.load()) {
            return Clock::now().time_since_epoch().count() >= deadline_.load();
        }
        return false;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> hasDeadline_{false};
    std::atomic<Clock::rep> deadline_{0};
};

} // namespace eda::application
