#include "adapters/secondary/events/DeliveryQueue.hpp"

namespace eda::adapters::secondary {

DeliveryQueue::~DeliveryQueue() {
    shutdown();
}

void DeliveryQueue::push(ports::output::PollResult item, uint64_t deliveryTag) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || failure_) return;
        queue_.push_back(Delivery{std::move(item), deliveryTag});
    }

    condVar_.notify_one();
}

std::optional<Delivery> DeliveryQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condVar_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_ || failure_; });

    if (queue_.empty()) {
        if (failure_ && !shutdown_) {
            return Delivery{ports::output::PollResult::transportError(*failure_), 0};
        }
        return std::nullopt;
    }

    auto item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

void DeliveryQueue::fail(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || failure_) return;
        failure_ = error;
    }
    condVar_.notify_all();
}

void DeliveryQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condVar_.notify_all();
}

bool DeliveryQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

std::optional<std::string> DeliveryQueue::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

size_t DeliveryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace eda::adapters::secondary
