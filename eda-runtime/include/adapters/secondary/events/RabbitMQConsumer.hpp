#pragma once

#include "adapters/secondary/events/DeliveryQueue.hpp"
#include "adapters/secondary/events/RabbitMQConnection.hpp"
#include "domain/Errors.hpp"
#include "ports/output/IMessageConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <future>
#include <memory>
#include <mutex>

namespace eda::adapters::secondary {

/**
 * @brief Входящее соединение с RabbitMQ
 *
 * Отображение на модель топиков:
 * - topic - stream-очередь с тем же именем, привязанная к exchange
 *   с routing key = topic;
 * - group - consumer tag;
 * - чтение с начала потока (x-stream-offset: first) при каждом
 *   (пере)запуске consume.
 *
 * Доставки из I/O потока попадают в DeliveryQueue, poll() забирает их.
 * Подтверждение (ack) отправляется, когда poll() отдаёт сообщение движку,
 * поэтому prefetch ограничивает число сообщений в очереди.
 *
 * Соединение не восстанавливается: после ошибки соединения или канала
 * каждый poll() возвращает TRANSPORT_ERROR.
 *
 * @example
 * ```cpp
 * auto settings = std::make_shared<RabbitMQSettings>();
 * RabbitMQConsumer consumer(settings, "localhost:5672");
 * consumer.subscribe("events", "poc");
 * auto result = consumer.poll(std::chrono::milliseconds(100));
 * ```
 */
class RabbitMQConsumer : public ports::output::IMessageConsumer {
public:
    RabbitMQConsumer(std::shared_ptr<settings::RabbitMQSettings> settings, const std::string& broker)
        : settings_(std::move(settings))
        , exchangeName_(settings_->getExchange())
        , connection_(std::make_unique<RabbitMQConnection>(
              "RabbitMQConsumer",
              settings_->getConnectionString(broker),
              [this](const std::string& error) { onConnectionLost(error); }))
    {
        std::cout << "[RabbitMQConsumer] Created for " << broker
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQConsumer() override {
        close();
    }

    void subscribe(const std::string& topic, const std::string& group) override {
        topic_ = topic;
        group_ = group;

        std::future<void> ready;
        {
            std::lock_guard<std::mutex> lock(readyMutex_);
            readyPromise_ = std::make_unique<std::promise<void>>();
            ready = readyPromise_->get_future();
        }

        connection_->start([this](AMQP::TcpChannel& channel) { declareTopology(channel); });

        auto timeout = std::chrono::milliseconds(settings_->getConnectTimeoutMs());
        if (ready.wait_for(timeout) != std::future_status::ready) {
            close();
            throw domain::TransportError("timed out subscribing to " + topic_
                                         + " after " + std::to_string(timeout.count()) + "ms");
        }

        try {
            ready.get();
        } catch (const std::exception&) {
            close();
            throw;
        }
    }

    ports::output::PollResult poll(std::chrono::milliseconds timeout) override {
        auto item = deliveries_.popFor(timeout);
        if (!item) {
            if (deliveries_.isShutdown()) {
                return ports::output::PollResult::transportError("consumer is closed");
            }
            return ports::output::PollResult::timeout();
        }
        if (item->deliveryTag != 0) {
            acknowledge(item->deliveryTag);
        }
        return std::move(item->result);
    }

    void close() override {
        deliveries_.shutdown();
        connection_->stop();
    }

private:
    // Выполняется в I/O потоке
    void declareTopology(AMQP::TcpChannel& channel) {
        channel.declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onError([this](const char* message) {
                failSubscribe(std::string("exchange declare failed: ") + message);
            });

        AMQP::Table arguments;
        arguments.set("x-queue-type", "stream");

        channel.declareQueue(topic_, AMQP::durable, arguments)
            .onSuccess([this](const std::string& name, uint32_t, uint32_t) {
                std::cout << "[RabbitMQConsumer] Stream declared: " << name << std::endl;
            })
            .onError([this](const char* message) {
                failSubscribe(std::string("stream declare failed: ") + message);
            });

        channel.bindQueue(exchangeName_, topic_, topic_)
            .onError([this](const char* message) {
                failSubscribe(std::string("bind failed: ") + message);
            });

        channel.setQos(settings_->getPrefetch());

        startConsuming(channel);
    }

    void startConsuming(AMQP::TcpChannel& channel) {
        AMQP::Table arguments;
        arguments.set("x-stream-offset", "first");

        channel.consume(topic_, group_, 0, arguments)
            .onSuccess([this](const std::string& tag) {
                std::cout << "[RabbitMQConsumer] Assigned topic=" << topic_
                          << " consumer_tag=" << tag << " offset=first" << std::endl;
                signalReady();
            })
            .onReceived([this](const AMQP::Message& message, uint64_t deliveryTag, bool) {
                deliveries_.push(ports::output::PollResult::received(toBrokerMessage(message)), deliveryTag);
            })
            .onCancelled([this, &channel](const std::string& tag) {
                std::cerr << "[RabbitMQConsumer] Revoked consumer_tag=" << tag
                          << ", re-consuming from first offset" << std::endl;
                reportTransportError("consumer cancelled by broker");
                startConsuming(channel);
            })
            .onError([this](const char* message) {
                failSubscribe(std::string("consume failed: ") + message);
            });
    }

    void acknowledge(uint64_t deliveryTag) {
        connection_->post([this, deliveryTag]() {
            if (auto* channel = connection_->channel()) {
                channel->ack(deliveryTag);
            }
        });
    }

    domain::BrokerMessage toBrokerMessage(const AMQP::Message& message) const {
        domain::BrokerMessage result;
        result.topic = topic_;
        result.body.assign(message.body(), message.bodySize());
        if (message.hasMessageID()) {
            result.key = message.messageID();
        }
        if (message.hasContentType()) {
            result.headers["content-type"] = message.contentType();
        }

        const AMQP::Table& headers = message.headers();
        for (const auto& name : headers.keys()) {
            const AMQP::Field& field = headers.get(name);
            if (field.isString()) {
                result.headers[name] = static_cast<const std::string&>(field);
            }
        }
        return result;
    }

    void signalReady() {
        std::lock_guard<std::mutex> lock(readyMutex_);
        if (readyPromise_) {
            readyPromise_->set_value();
            readyPromise_.reset();
        }
    }

    /**
     * @brief Ошибка до подписки прерывает subscribe(), после - уходит в poll()
     */
    void failSubscribe(const std::string& error) {
        std::cerr << "[RabbitMQConsumer] " << error << std::endl;
        onConnectionLost(error);
    }

    bool failPendingSubscribe(const std::string& error) {
        std::lock_guard<std::mutex> lock(readyMutex_);
        if (!readyPromise_) {
            return false;
        }
        readyPromise_->set_exception(std::make_exception_ptr(domain::TransportError(error)));
        readyPromise_.reset();
        return true;
    }

    // Разовая ошибка: чтение продолжается
    void reportTransportError(const std::string& error) {
        if (!failPendingSubscribe(error)) {
            deliveries_.push(ports::output::PollResult::transportError(error));
        }
    }

    // Соединение или канал потеряны: ошибка повторяется на каждом poll()
    void onConnectionLost(const std::string& error) {
        if (!failPendingSubscribe(error)) {
            std::cerr << "[RabbitMQConsumer] Connection lost: " << error << std::endl;
            deliveries_.fail(error);
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string topic_;
    std::string group_;

    DeliveryQueue deliveries_;

    std::mutex readyMutex_;
    std::unique_ptr<std::promise<void>> readyPromise_;

    std::unique_ptr<RabbitMQConnection> connection_;
};

} // namespace eda::adapters::secondary
