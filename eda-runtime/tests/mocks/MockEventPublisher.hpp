#pragma once

#include "domain/Errors.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "mocks/CallLog.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eda::tests {

/**
 * @brief Mock реализация IEventPublisher для тестов
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string target;
        std::string key;
        std::string message;
        std::optional<std::string> cluster;
    };

    explicit MockEventPublisher(std::shared_ptr<CallLog> log = nullptr)
        : log_(std::move(log)) {}

    // Получение опубликованных сообщений
    const std::vector<PublishedMessage>& getPublishedMessages() const {
        return messages_;
    }

    int publishCallCount() const { return static_cast<int>(messages_.size()); }
    int flushCallCount() const { return flushCalls_; }
    int closeCallCount() const { return closeCalls_; }

    // Следующие publish() бросают TransportError
    void setFailPublish(bool fail) { failPublish_ = fail; }

    // IEventPublisher implementation
    void publish(const std::string& target,
                 const std::string& key,
                 const std::string& message,
                 const std::optional<std::string>& cluster) override {
        if (failPublish_) {
            throw domain::TransportError("broker unavailable");
        }
        messages_.push_back({target, key, message, cluster});
    }

    bool flush(std::chrono::milliseconds) override {
        ++flushCalls_;
        if (log_) log_->record("publisher.flush");
        return true;
    }

    void close() override {
        ++closeCalls_;
        if (log_) log_->record("publisher.close");
    }

private:
    std::shared_ptr<CallLog> log_;
    std::vector<PublishedMessage> messages_;
    bool failPublish_ = false;
    int flushCalls_ = 0;
    int closeCalls_ = 0;
};

} // namespace eda::tests

namespace eda::tests {

/**
 * @brief Передаёт вызовы общему MockEventPublisher
 *
 * Движок владеет publisher'ом и уничтожает его при закрытии;
 * тест проверяет состояние через shared_ptr.
 */
class PublisherHandle : public ports::output::IEventPublisher {
public:
    explicit PublisherHandle(std::shared_ptr<MockEventPublisher> target)
        : target_(std::move(target)) {}

    void publish(const std::string& target,
                 const std::string& key,
                 const std::string& message,
                 const std::optional<std::string>& cluster) override {
        target_->publish(target, key, message, cluster);
    }

    bool flush(std::chrono::milliseconds timeout) override { return target_->flush(timeout); }

    void close() override { target_->close(); }

private:
    std::shared_ptr<MockEventPublisher> target_;
};

} // namespace eda::tests
