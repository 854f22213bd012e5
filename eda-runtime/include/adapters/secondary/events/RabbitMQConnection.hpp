#pragma once

#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace eda::adapters::secondary {

/**
 * @brief Соединение AMQP-CPP со своим потоком Boost.Asio
 *
 * Все обращения к TcpConnection/TcpChannel выполняются в I/O потоке:
 * снаружи работа передаётся через post().
 */
class RabbitMQConnection {
public:
    using ErrorCallback = std::function<void(const std::string&)>;
    using OpenCallback = std::function<void(AMQP::TcpChannel&)>;

    RabbitMQConnection(std::string name, std::string address, ErrorCallback onError)
        : name_(std::move(name))
        , address_(std::move(address))
        , onError_(std::move(onError))
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_, *this)
    {}

    ~RabbitMQConnection() {
        stop();
    }

    RabbitMQConnection(const RabbitMQConnection&) = delete;
    RabbitMQConnection& operator=(const RabbitMQConnection&) = delete;

    /**
     * @brief Запустить I/O поток и открыть канал
     * @param onOpen Вызывается в I/O потоке сразу после создания канала
     */
    void start(OpenCallback onOpen) {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this, onOpen = std::move(onOpen)]() {
            try {
                connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(address_));
                channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());
                channel_->onError([this](const char* message) {
                    reportError(std::string("channel error: ") + message);
                });
                onOpen(*channel_);
                ioContext_.run();
            } catch (const std::exception& e) {
                reportError(std::string("worker error: ") + e.what());
            }
        });

        std::cout << "[" << name_ << "] Started" << std::endl;
    }

    void post(std::function<void()> task) {
        boost::asio::post(ioContext_, std::move(task));
    }

    /**
     * @brief Канал (только из I/O потока)
     */
    AMQP::TcpChannel* channel() { return channel_.get(); }

    bool isRunning() const { return running_; }

    /**
     * @brief Закрыть канал и соединение, остановить поток
     */
    void stop() {
        if (!running_.exchange(false)) return;

        auto closed = std::make_shared<std::promise<void>>();
        auto closedFuture = closed->get_future();
        post([this, closed]() {
            if (channel_) channel_->close();
            if (connection_) connection_->close();
            closed->set_value();
        });
        closedFuture.wait_for(std::chrono::seconds(1));

        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[" << name_ << "] Stopped" << std::endl;
    }

private:
    class Handler : public AMQP::LibBoostAsioHandler {
    public:
        Handler(boost::asio::io_context& ioContext, RabbitMQConnection& owner)
            : AMQP::LibBoostAsioHandler(ioContext)
            , owner_(owner)
        {}

        void onError(AMQP::TcpConnection*, const char* message) override {
            owner_.reportError(std::string("connection error: ") + message);
        }

    private:
        RabbitMQConnection& owner_;
    };

    void reportError(const std::string& message) {
        std::cerr << "[" << name_ << "] " << message << std::endl;
        if (onError_) {
            onError_(message);
        }
    }

    std::string name_;
    std::string address_;
    ErrorCallback onError_;
    std::atomic<bool> running_{false};

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    Handler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace eda::adapters::secondary
