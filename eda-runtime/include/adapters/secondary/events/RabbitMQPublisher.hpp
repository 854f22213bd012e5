#pragma once

#include "adapters/secondary/events/RabbitMQConnection.hpp"
#include "domain/Errors.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>

namespace eda::adapters::secondary {

/**
 * @brief Исходящее соединение с RabbitMQ
 *
 * Публикует в topic exchange: target - routing key, key - message id.
 * Соединение отдельное от входящего. Публикации передаются в I/O поток
 * и учитываются, чтобы flush() мог дождаться их отправки.
 *
 * Кластер назначения должен совпадать с RABBITMQ_CLUSTER.
 */
class RabbitMQPublisher : public ports::output::IEventPublisher {
public:
    /**
     * @throws domain::TransportError если exchange не объявлен за таймаут подключения
     */
    RabbitMQPublisher(std::shared_ptr<settings::RabbitMQSettings> settings, const std::string& broker)
        : settings_(std::move(settings))
        , exchangeName_(settings_->getExchange())
        , connection_(std::make_unique<RabbitMQConnection>(
              "RabbitMQPublisher",
              settings_->getConnectionString(broker),
              [this](const std::string& error) { onTransportError(error); }))
    {
        std::future<void> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            readyPromise_ = std::make_unique<std::promise<void>>();
            ready = readyPromise_->get_future();
        }

        connection_->start([this](AMQP::TcpChannel& channel) {
            channel.declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
                .onSuccess([this]() {
                    std::cout << "[RabbitMQPublisher] Exchange declared: " << exchangeName_ << std::endl;
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (readyPromise_) {
                        readyPromise_->set_value();
                        readyPromise_.reset();
                    }
                });
        });

        auto timeout = std::chrono::milliseconds(settings_->getConnectTimeoutMs());
        if (ready.wait_for(timeout) != std::future_status::ready) {
            connection_->stop();
            throw domain::TransportError("timed out connecting publisher to " + broker);
        }
        try {
            ready.get();
        } catch (const std::exception&) {
            connection_->stop();
            throw;
        }

        std::cout << "[RabbitMQPublisher] Connected to " << broker
                  << " exchange=" << exchangeName_
                  << " cluster=" << settings_->getCluster() << std::endl;
    }

    ~RabbitMQPublisher() override {
        close();
    }

    void publish(const std::string& target,
                 const std::string& key,
                 const std::string& message,
                 const std::optional<std::string>& cluster) override {
        if (cluster && *cluster != settings_->getCluster()) {
            throw domain::TransportError("unknown cluster '" + *cluster
                                         + "', publisher serves '" + settings_->getCluster() + "'");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connection_->isRunning()) {
                throw domain::TransportError("publisher is closed");
            }
            if (!lastError_.empty()) {
                throw domain::TransportError("publisher connection failed: " + lastError_);
            }
            ++pending_;
        }

        connection_->post([this, target, key, message]() {
            bool sent = false;
            if (auto* channel = connection_->channel()) {
                AMQP::Envelope envelope(message.data(), message.size());
                envelope.setMessageID(key);
                envelope.setContentType("application/cloudevents+json");
                envelope.setPersistent(true);
                sent = channel->publish(exchangeName_, target, envelope);
            }
            if (!sent) {
                std::cerr << "[RabbitMQPublisher] Publish failed target=" << target
                          << " key=" << key << std::endl;
            }
            completeOne();
        });
    }

    bool flush(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        return drained_.wait_for(lock, timeout, [this]() { return pending_ == 0; });
    }

    void close() override {
        connection_->stop();

        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ > 0) {
            std::cerr << "[RabbitMQPublisher] Closed with unsent messages pending=" << pending_ << std::endl;
        }
        pending_ = 0;
        drained_.notify_all();
    }

private:
    void completeOne() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_ > 0) --pending_;
        }
        drained_.notify_all();
    }

    void onTransportError(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (readyPromise_) {
            readyPromise_->set_exception(std::make_exception_ptr(domain::TransportError(error)));
            readyPromise_.reset();
            return;
        }
        lastError_ = error;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::mutex mutex_;
    std::condition_variable drained_;
    size_t pending_ = 0;
    std::string lastError_;
    std::unique_ptr<std::promise<void>> readyPromise_;

    std::unique_ptr<RabbitMQConnection> connection_;
};

} // namespace eda::adapters::secondary
