#include "application/DispatchEngine.hpp"

#include "domain/Errors.hpp"
#include "domain/RetryAttempt.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace eda::application {

using domain::EngineState;

DispatchEngine::DispatchEngine(ports::output::CoreFactory coreFactory,
                               ports::input::Handler handler,
                               ConsumerFactory consumerFactory,
                               PublisherFactory publisherFactory,
                               std::shared_ptr<ports::output::IEventCodec> codec,
                               EngineOptions options)
    : coreFactory_(std::move(coreFactory))
    , handler_(std::move(handler))
    , consumerFactory_(std::move(consumerFactory))
    , publisherFactory_(std::move(publisherFactory))
    , codec_(std::move(codec))
    , options_(std::move(options))
{
    if (options_.maxConsecutiveErrors == 0) {
        options_.maxConsecutiveErrors = 1;
    }
}

DispatchEngine::~DispatchEngine() {
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

void DispatchEngine::configure() {
    requireState(EngineState::CREATED, "configure");

    try {
        adapter_.emplace(handler_);

        if (!coreFactory_) {
            throw domain::ConfigurationError("core factory is not set");
        }
        if (!codec_) {
            throw domain::ConfigurationError("event codec is not set");
        }

        try {
            core_ = coreFactory_();
        } catch (const std::exception& e) {
            throw domain::ConfigurationError("core factory failed: " + std::string(e.what()));
        }
        if (!core_) {
            throw domain::ConfigurationError("core factory returned no backend");
        }

        try {
            config_ = core_->getConnectionConfig();
        } catch (const std::exception& e) {
            throw domain::ConfigurationError("connection config unavailable: " + std::string(e.what()));
        }
        config_.validate();

        loadRouting();

        std::cout << "[DispatchEngine] Configured"
                  << " broker=" << config_.broker
                  << " topic=" << config_.topic
                  << " group=" << config_.group
                  << " handler=" << toString(adapter_->shape()) << std::endl;

        transition(EngineState::CONFIGURED);
    } catch (const std::exception& e) {
        fail(e.what());
        throw;
    }
}

void DispatchEngine::subscribe() {
    requireState(EngineState::CONFIGURED, "subscribe");

    try {
        if (!consumerFactory_) {
            throw domain::ConfigurationError("consumer factory is not set");
        }

        try {
            consumer_ = consumerFactory_(config_);
        } catch (const std::exception& e) {
            throw domain::TransportError("cannot open inbound connection: " + std::string(e.what()));
        }
        if (!consumer_) {
            throw domain::TransportError("consumer factory returned no connection");
        }

        try {
            consumer_->subscribe(config_.topic, config_.group);
        } catch (const domain::TransportError&) {
            throw;
        } catch (const std::exception& e) {
            throw domain::TransportError("subscribe failed: " + std::string(e.what()));
        }

        // Исходящее соединение нужно только handler'у с выходными событиями
        if (adapter_->producesOutput()) {
            if (!publisherFactory_) {
                throw domain::ConfigurationError("publisher factory is not set for an output handler");
            }
            try {
                publisher_ = publisherFactory_(config_);
            } catch (const std::exception& e) {
                throw domain::TransportError("cannot open outbound connection: " + std::string(e.what()));
            }
            if (!publisher_) {
                throw domain::TransportError("publisher factory returned no connection");
            }
        }

        router_ = std::make_unique<OutputRouter>(*core_, codec_, publisher_.get());

        std::cout << "[DispatchEngine] Subscribed topic=" << config_.topic
                  << " group=" << config_.group << std::endl;

        transition(EngineState::SUBSCRIBED);
    } catch (const std::exception& e) {
        fail(e.what());
        throw;
    }
}

void DispatchEngine::run(const CancellationToken& token) {
    requireState(EngineState::SUBSCRIBED, "run");
    transition(EngineState::RUNNING);

    std::cout << "[DispatchEngine] Running"
              << " poll_timeout_ms=" << options_.pollTimeout.count()
              << " max_consecutive_errors=" << options_.maxConsecutiveErrors << std::endl;

    while (!token.isCancelled()) {
        ports::output::PollResult result;
        try {
            result = consumer_->poll(options_.pollTimeout);
        } catch (const std::exception& e) {
            result = ports::output::PollResult::transportError(e.what());
        }

        switch (result.status) {
            case ports::output::PollResult::Status::TIMEOUT:
                break;

            case ports::output::PollResult::Status::TRANSPORT_ERROR: {
                ++consecutiveErrors_;
                ++counters_.transportErrors;
                std::cerr << "[DispatchEngine] Consumer error: " << result.error
                          << " consecutive=" << consecutiveErrors_ << std::endl;

                if (consecutiveErrors_ >= options_.maxConsecutiveErrors) {
                    std::string reason = "too many consecutive consumer errors ("
                        + std::to_string(consecutiveErrors_) + "), last: " + result.error;
                    close();
                    throw domain::TransportError(reason);
                }
                break;
            }

            case ports::output::PollResult::Status::MESSAGE:
                consecutiveErrors_ = 0;
                if (result.message) {
                    processMessage(*result.message);
                }
                break;
        }
    }

    std::cout << "[DispatchEngine] Cancellation observed, draining" << std::endl;
    close();
}

void DispatchEngine::start(const CancellationToken& token) {
    configure();
    subscribe();
    run(token);
}

void DispatchEngine::close() noexcept {
    std::lock_guard<std::mutex> lock(closeMutex_);

    EngineState current = state_.load();
    if (current == EngineState::CLOSED || current == EngineState::FAILED) {
        return;
    }

    transition(EngineState::DRAINING);
    releaseResources();
    transition(EngineState::CLOSED);
    logStats();
}

EngineStats DispatchEngine::stats() const {
    EngineStats snapshot;
    snapshot.received = counters_.received.load();
    snapshot.decodeFailures = counters_.decodeFailures.load();
    snapshot.handled = counters_.handled.load();
    snapshot.handlerFailures = counters_.handlerFailures.load();
    snapshot.outputsPublished = counters_.outputsPublished.load();
    snapshot.outputsDiscarded = counters_.outputsDiscarded.load();
    snapshot.routingFailures = counters_.routingFailures.load();
    snapshot.transportErrors = counters_.transportErrors.load();
    return snapshot;
}

// ============================================================================
// Per message
// ============================================================================

void DispatchEngine::processMessage(const domain::BrokerMessage& message) {
    ++counters_.received;

    domain::Event event;
    try {
        event = codec_->decode(message);
    } catch (const std::exception& e) {
        ++counters_.decodeFailures;
        std::cerr << "[DispatchEngine] Skipping undecodable message: " << e.what()
                  << " topic=" << message.topic
                  << " key=" << message.key << std::endl;
        return;
    }

    auto outcome = adapter_->invoke(event);

    switch (outcome.kind()) {
        case domain::HandlerOutcome::Kind::ACK:
            ++counters_.handled;
            break;

        case domain::HandlerOutcome::Kind::ACK_WITH_OUTPUT:
            ++counters_.handled;
            routeOutput(outcome.output());
            break;

        case domain::HandlerOutcome::Kind::FAILURE:
            ++counters_.handlerFailures;
            handleFailure(event, outcome.error());
            break;
    }
}

void DispatchEngine::routeOutput(const domain::Event& output) {
    try {
        auto result = router_->route(output);
        if (result == OutputRouter::Result::PUBLISHED) {
            ++counters_.outputsPublished;
        } else {
            ++counters_.outputsDiscarded;
        }
    } catch (const std::exception& e) {
        ++counters_.routingFailures;
        std::cerr << "[DispatchEngine] Failed to route output event: " << e.what()
                  << " event_id=" << output.id
                  << " event_type=" << output.type << std::endl;
    }
}

void DispatchEngine::handleFailure(const domain::Event& event, const std::string& error) {
    domain::RetryAttempt attempt{error, 1};

    std::cerr << "[DispatchEngine] Handler error: " << attempt.errorMessage
              << " event_id=" << event.id
              << " event_type=" << event.type << std::endl;

    bool retry = false;
    try {
        retry = core_->shouldRetry(attempt.errorMessage, attempt.attemptNumber);
    } catch (const std::exception& e) {
        std::cerr << "[DispatchEngine] Retry decision failed, not retrying: " << e.what()
                  << " event_id=" << event.id << std::endl;
        return;
    }

    if (!retry) {
        return;
    }

    uint64_t backoffMs = 0;
    try {
        backoffMs = core_->calculateBackoff(attempt.attemptNumber);
    } catch (const std::exception& e) {
        std::cerr << "[DispatchEngine] Backoff calculation failed: " << e.what()
                  << " event_id=" << event.id << std::endl;
    }

    // Повторная доставка не выполняется, решение только фиксируется
    std::cout << "[DispatchEngine] Would retry"
              << " event_id=" << event.id
              << " attempt=" << attempt.attemptNumber
              << " backoff_ms=" << backoffMs << std::endl;
}

// ============================================================================
// Internals
// ============================================================================

void DispatchEngine::requireState(EngineState expected, const char* operation) const {
    EngineState current = state_.load();
    if (current != expected) {
        throw std::logic_error(std::string("DispatchEngine::") + operation
                               + " is not allowed in state " + domain::toString(current));
    }
}

// Ошибка слушателя не влияет на переход: fail() и close() вызывают его из noexcept
void DispatchEngine::transition(EngineState next) noexcept {
    state_.store(next);
    if (!stateListener_) {
        return;
    }
    try {
        stateListener_(next);
    } catch (const std::exception& e) {
        std::cerr << "[DispatchEngine] State listener failed: " << e.what()
                  << " state=" << domain::toString(next) << std::endl;
    } catch (...) {
        std::cerr << "[DispatchEngine] State listener failed: unknown error"
                  << " state=" << domain::toString(next) << std::endl;
    }
}

void DispatchEngine::fail(const std::string& reason) noexcept {
    std::cerr << "[DispatchEngine] Startup failed: " << reason << std::endl;
    std::lock_guard<std::mutex> lock(closeMutex_);
    releaseResources();
    transition(EngineState::FAILED);
}

void DispatchEngine::loadRouting() {
    if (!options_.routingConfigPath || options_.routingConfigPath->empty()) {
        std::cout << "[DispatchEngine] No routing config, using backend default destination" << std::endl;
        return;
    }

    const std::string& path = *options_.routingConfigPath;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (options_.requireRouting) {
            throw domain::ConfigurationError("routing config is required but not found: " + path);
        }
        std::cout << "[DispatchEngine] Routing config not found, using backend default destination"
                  << " path=" << path << std::endl;
        return;
    }

    try {
        core_->loadRoutingConfig(path);
        std::cout << "[DispatchEngine] Routing config loaded path=" << path << std::endl;
    } catch (const std::exception& e) {
        if (options_.requireRouting) {
            throw domain::ConfigurationError("failed to load routing config " + path + ": " + e.what());
        }
        std::cerr << "[DispatchEngine] Failed to load routing config, using backend default: "
                  << e.what() << " path=" << path << std::endl;
    }
}

void DispatchEngine::releaseResources() noexcept {
    router_.reset();

    if (publisher_) {
        try {
            if (!publisher_->flush(options_.flushTimeout)) {
                std::cerr << "[DispatchEngine] Publisher flush timed out"
                          << " timeout_ms=" << options_.flushTimeout.count() << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[DispatchEngine] Publisher flush failed: " << e.what() << std::endl;
        }
        try {
            publisher_->close();
        } catch (const std::exception& e) {
            std::cerr << "[DispatchEngine] Publisher close failed: " << e.what() << std::endl;
        }
        publisher_.reset();
    }

    if (consumer_) {
        try {
            consumer_->close();
        } catch (const std::exception& e) {
            std::cerr << "[DispatchEngine] Consumer close failed: " << e.what() << std::endl;
        }
        consumer_.reset();
    }

    if (core_) {
        try {
            core_->close();
        } catch (const std::exception& e) {
            std::cerr << "[DispatchEngine] Core close failed: " << e.what() << std::endl;
        }
        core_.reset();
    }
}

void DispatchEngine::logStats() const {
    auto snapshot = stats();
    std::cout << "[DispatchEngine] Closed"
              << " received=" << snapshot.received
              << " decode_failures=" << snapshot.decodeFailures
              << " handled=" << snapshot.handled
              << " handler_failures=" << snapshot.handlerFailures
              << " outputs_published=" << snapshot.outputsPublished
              << " outputs_discarded=" << snapshot.outputsDiscarded
              << " routing_failures=" << snapshot.routingFailures
              << " transport_errors=" << snapshot.transportErrors << std::endl;
}

} // namespace eda::application
