#pragma once

#include "application/CancellationToken.hpp"
#include "application/HandlerAdapter.hpp"
#include "application/OutputRouter.hpp"
#include "domain/BrokerMessage.hpp"
#include "domain/ConnectionConfig.hpp"
#include "domain/enums/EngineState.hpp"
#include "ports/input/Handler.hpp"
#include "ports/output/ICore.hpp"
#include "ports/output/IEventCodec.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IMessageConsumer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace eda::application {

/**
 * @brief Параметры цикла движка
 */
struct EngineOptions {
    std::chrono::milliseconds pollTimeout{100};
    uint32_t maxConsecutiveErrors = 5;
    std::chrono::milliseconds flushTimeout{5000};
    std::optional<std::string> routingConfigPath;  ///< nullopt - не загружать
    bool requireRouting = false;
};

/**
 * @brief Снимок счётчиков движка
 */
struct EngineStats {
    uint64_t received = 0;
    uint64_t decodeFailures = 0;
    uint64_t handled = 0;
    uint64_t handlerFailures = 0;
    uint64_t outputsPublished = 0;
    uint64_t outputsDiscarded = 0;
    uint64_t routingFailures = 0;
    uint64_t transportErrors = 0;
};

using ConsumerFactory =
    std::function<std::unique_ptr<ports::output::IMessageConsumer>(const domain::ConnectionConfig&)>;
using PublisherFactory =
    std::function<std::unique_ptr<ports::output::IEventPublisher>(const domain::ConnectionConfig&)>;

/**
 * @brief Движок диспетчеризации событий
 *
 * Читает сообщения брокера, декодирует их в CloudEvents, вызывает
 * handler, передаёт ошибки в Core, выходные события - в OutputRouter.
 *
 * Жизненный цикл:
 * CREATED -> configure() -> CONFIGURED -> subscribe() -> SUBSCRIBED
 *         -> run() -> RUNNING -> DRAINING -> CLOSED
 *
 * Владеет Core, входящим соединением и publisher'ом. Освобождает их
 * в обратном порядке: flush + close publisher, close consumer, close Core.
 *
 * @example
 * ```cpp
 * DispatchEngine engine(coreFactory, makeHandler(myHandler),
 *                       consumerFactory, publisherFactory, codec);
 * CancellationToken token;
 * engine.start(token);   // блокирует до отмены или фатальной ошибки
 * ```
 */
class DispatchEngine {
public:
    using StateListener = std::function<void(domain::EngineState)>;

    DispatchEngine(ports::output::CoreFactory coreFactory,
                   ports::input::Handler handler,
                   ConsumerFactory consumerFactory,
                   PublisherFactory publisherFactory,
                   std::shared_ptr<ports::output::IEventCodec> codec,
                   EngineOptions options = {});

    ~DispatchEngine();

    DispatchEngine(const DispatchEngine&) = delete;
    DispatchEngine& operator=(const DispatchEngine&) = delete;

    /**
     * @brief CREATED -> CONFIGURED
     * @throws domain::ConfigurationError (состояние становится FAILED)
     */
    void configure();

    /**
     * @brief CONFIGURED -> SUBSCRIBED
     * @throws domain::TransportError, domain::ConfigurationError (состояние FAILED)
     */
    void subscribe();

    /**
     * @brief Цикл обработки до отмены токена
     *
     * По выходу движок закрыт.
     *
     * @throws domain::TransportError при срабатывании предохранителя
     */
    void run(const CancellationToken& token);

    /**
     * @brief configure() + subscribe() + run()
     */
    void start(const CancellationToken& token);

    /**
     * @brief Освободить ресурсы. Идемпотентен.
     */
    void close() noexcept;

    domain::EngineState state() const { return state_.load(); }

    EngineStats stats() const;

    const domain::ConnectionConfig& connectionConfig() const { return config_; }

    uint32_t consecutiveTransportErrors() const { return consecutiveErrors_; }

    void onStateChange(StateListener listener) { stateListener_ = std::move(listener); }

private:
    void requireState(domain::EngineState expected, const char* operation) const;
    void transition(domain::EngineState next) noexcept;
    void fail(const std::string& reason) noexcept;
    void loadRouting();
    void processMessage(const domain::BrokerMessage& message);
    void routeOutput(const domain::Event& output);
    void handleFailure(const domain::Event& event, const std::string& error);
    void releaseResources() noexcept;
    void logStats() const;

    ports::output::CoreFactory coreFactory_;
    ports::input::Handler handler_;
    ConsumerFactory consumerFactory_;
    PublisherFactory publisherFactory_;
    std::shared_ptr<ports::output::IEventCodec> codec_;
    EngineOptions options_;

    std::atomic<domain::EngineState> state_{domain::EngineState::CREATED};
    StateListener stateListener_;
    std::mutex closeMutex_;

    std::unique_ptr<ports::output::ICore> core_;
    std::optional<HandlerAdapter> adapter_;
    std::unique_ptr<ports::output::IMessageConsumer> consumer_;
    std::unique_ptr<ports::output::IEventPublisher> publisher_;
    std::unique_ptr<OutputRouter> router_;
    domain::ConnectionConfig config_;

    uint32_t consecutiveErrors_ = 0;

    struct Counters {
        std::atomic<uint64_t> received{0};
        std::atomic<uint64_t> decodeFailures{0};
        std::atomic<uint64_t> handled{0};
        std::atomic<uint64_t> handlerFailures{0};
        std::atomic<uint64_t> outputsPublished{0};
        std::atomic<uint64_t> outputsDiscarded{0};
        std::atomic<uint64_t> routingFailures{0};
        std::atomic<uint64_t> transportErrors{0};
    } counters_;
};

} // namespace eda::application
