/**
 * @file DispatchEngineTest.cpp
 * @brief Unit tests for DispatchEngine
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/DispatchEngine.hpp"
#include "adapters/secondary/codec/CloudEventJsonCodec.hpp"
#include "domain/Errors.hpp"
#include "mocks/CallLog.hpp"
#include "mocks/MockCore.hpp"
#include "mocks/MockEventPublisher.hpp"
#include "mocks/ScriptedMessageConsumer.hpp"
#include <nlohmann/json.hpp>

using namespace eda;
using namespace eda::application;
using namespace eda::tests;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::string eventJson(const std::string& id, const std::string& type, const std::string& source = "/shop") {
    return nlohmann::json{{"specversion", "1.0"}, {"id", id}, {"type", type}, {"source", source}}.dump();
}

std::string idOf(const std::string& envelope) {
    return nlohmann::json::parse(envelope).at("id").get<std::string>();
}

} // namespace

class DispatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<CallLog>();

        auto core = std::make_unique<NiceMock<MockCore>>();
        core_ = core.get();
        pendingCore_ = std::move(core);

        consumer_ = std::make_shared<ScriptedMessageConsumer>(log_);
        publisher_ = std::make_shared<MockEventPublisher>(log_);
        codec_ = std::make_shared<adapters::secondary::CloudEventJsonCodec>();

        ON_CALL(*core_, getConnectionConfig())
            .WillByDefault(Return(domain::ConnectionConfig("localhost:5672", "events", "poc")));
        ON_CALL(*core_, getOutputDestination(_))
            .WillByDefault(Return(domain::OutputDestination(
                domain::DestinationType::BROKER, "events", std::string("default"))));
        ON_CALL(*core_, close())
            .WillByDefault(Invoke([this]() { log_->record("core.close"); }));

        consumer_->onExhausted([this]() { token_.cancel(); });
    }

    std::unique_ptr<DispatchEngine> makeEngine(ports::input::Handler handler, EngineOptions options = {}) {
        return std::make_unique<DispatchEngine>(
            [this]() -> std::unique_ptr<ports::output::ICore> {
                if (coreFactoryFails_) {
                    throw std::runtime_error("backend unavailable");
                }
                return std::move(pendingCore_);
            },
            std::move(handler),
            [this](const domain::ConnectionConfig&) -> std::unique_ptr<ports::output::IMessageConsumer> {
                ++consumersCreated_;
                return std::make_unique<ConsumerHandle>(consumer_);
            },
            [this](const domain::ConnectionConfig&) -> std::unique_ptr<ports::output::IEventPublisher> {
                ++publishersCreated_;
                return std::make_unique<PublisherHandle>(publisher_);
            },
            codec_,
            options);
    }

    static ports::input::Handler recordingHandler(std::vector<std::string>& seen) {
        return ports::input::makeHandler([&seen](const domain::Event& event) {
            seen.push_back(event.id);
        });
    }

    std::shared_ptr<CallLog> log_;
    NiceMock<MockCore>* core_ = nullptr;
    std::unique_ptr<NiceMock<MockCore>> pendingCore_;
    std::shared_ptr<ScriptedMessageConsumer> consumer_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<adapters::secondary::CloudEventJsonCodec> codec_;
    CancellationToken token_;
    bool coreFactoryFails_ = false;
    int consumersCreated_ = 0;
    int publishersCreated_ = 0;
};

// ============================================================================
// MESSAGE PROCESSING TESTS
// ============================================================================

TEST_F(DispatchEngineTest, MalformedInput_DoesNotStopLoop) {
    consumer_->addMessage("not json at all")
        .addMessage(R"({"id":"x"})")
        .addMessage("")
        .addMessage(eventJson("e1", "order.created"));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    engine->start(token_);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "e1");
    EXPECT_EQ(engine->stats().received, 4u);
    EXPECT_EQ(engine->stats().decodeFailures, 3u);
    EXPECT_EQ(engine->stats().handled, 1u);
    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
}

TEST_F(DispatchEngineTest, SimpleHandlerSuccess_NoPublishNoRetry) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, shouldRetry(_, _)).Times(0);
    EXPECT_CALL(*core_, calculateBackoff(_)).Times(0);
    EXPECT_CALL(*core_, getOutputDestination(_)).Times(0);

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));
    engine->start(token_);

    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(publishersCreated_, 0);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(DispatchEngineTest, OutputHandler_RoutesProducedEventOnce) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    std::string seenEnvelope;
    EXPECT_CALL(*core_, getOutputDestination(_))
        .Times(1)
        .WillOnce(Invoke([&seenEnvelope](const std::string& envelope) {
            seenEnvelope = envelope;
            return domain::OutputDestination(domain::DestinationType::BROKER, "orders.processed");
        }));

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event& event) -> std::optional<domain::Event> {
            return domain::Event("processed-" + event.id, "order.processed", event.source);
        }));
    engine->start(token_);

    EXPECT_EQ(idOf(seenEnvelope), "processed-e1");
    EXPECT_EQ(nlohmann::json::parse(seenEnvelope)["type"], "order.processed");

    ASSERT_EQ(publisher_->publishCallCount(), 1);
    const auto& msg = publisher_->getPublishedMessages()[0];
    EXPECT_EQ(msg.target, "orders.processed");
    EXPECT_EQ(msg.key, "processed-e1");
    EXPECT_EQ(msg.message, seenEnvelope);
    EXPECT_FALSE(msg.cluster.has_value());
    EXPECT_EQ(engine->stats().outputsPublished, 1u);
}

TEST_F(DispatchEngineTest, OutputHandler_ReturningNothing_IsAck) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, getOutputDestination(_)).Times(0);

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event&) -> std::optional<domain::Event> { return std::nullopt; }));
    engine->start(token_);

    EXPECT_EQ(publishersCreated_, 1);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
    EXPECT_EQ(engine->stats().handled, 1u);
}

TEST_F(DispatchEngineTest, HandlerError_ConsultsRetryOnceWithFirstAttempt) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, shouldRetry("inventory service down", 1u)).Times(1).WillOnce(Return(false));
    EXPECT_CALL(*core_, calculateBackoff(_)).Times(0);

    auto engine = makeEngine(ports::input::makeHandler([](const domain::Event&) {
        throw std::runtime_error("inventory service down");
    }));
    engine->start(token_);

    EXPECT_EQ(engine->stats().handlerFailures, 1u);
    EXPECT_EQ(engine->consecutiveTransportErrors(), 0u);
}

TEST_F(DispatchEngineTest, HandlerError_RetryApproved_CalculatesBackoffOnce) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, shouldRetry("boom", 1u)).WillOnce(Return(true));
    EXPECT_CALL(*core_, calculateBackoff(1u)).Times(1).WillOnce(Return(250u));

    auto engine = makeEngine(ports::input::makeHandler([](const domain::Event&) {
        throw std::runtime_error("boom");
    }));
    engine->start(token_);

    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
}

TEST_F(DispatchEngineTest, HandlerError_RetryDecisionFailure_IsNotFatal) {
    consumer_->addMessage(eventJson("e1", "order.created"))
        .addMessage(eventJson("e2", "order.created"));

    EXPECT_CALL(*core_, shouldRetry(_, _))
        .Times(2)
        .WillRepeatedly(Throw(domain::CoreError("backend crashed")));
    EXPECT_CALL(*core_, calculateBackoff(_)).Times(0);

    auto engine = makeEngine(ports::input::makeHandler([](const domain::Event&) {
        throw std::runtime_error("boom");
    }));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(engine->stats().handlerFailures, 2u);
}

TEST_F(DispatchEngineTest, HandlerThrowingNonException_LoopContinues) {
    consumer_->addMessage(eventJson("e1", "order.created"))
        .addMessage(eventJson("e2", "order.created"));

    EXPECT_CALL(*core_, shouldRetry("unknown handler error", 1u)).WillOnce(Return(false));

    int calls = 0;
    auto engine = makeEngine(ports::input::makeHandler([&calls](const domain::Event&) {
        if (++calls == 1) {
            throw 42;
        }
    }));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(engine->stats().handlerFailures, 1u);
    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
}

// ============================================================================
// CIRCUIT BREAKER TESTS
// ============================================================================

TEST_F(DispatchEngineTest, FiveConsecutiveTransportErrors_AreFatal) {
    for (int i = 0; i < 5; ++i) {
        consumer_->addError();
    }
    consumer_->addMessage(eventJson("never", "order.created"));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->start(token_), domain::TransportError);
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
    EXPECT_EQ(engine->stats().transportErrors, 5u);
    EXPECT_LT(log_->indexOf("consumer.close"), log_->indexOf("core.close"));
}

TEST_F(DispatchEngineTest, FourErrorsThenSuccess_ResetsCounter) {
    for (int i = 0; i < 4; ++i) {
        consumer_->addError();
    }
    consumer_->addMessage(eventJson("e1", "order.created"));
    for (int i = 0; i < 4; ++i) {
        consumer_->addError();
    }

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(engine->stats().transportErrors, 8u);
    EXPECT_EQ(engine->consecutiveTransportErrors(), 4u);
}

TEST_F(DispatchEngineTest, Timeouts_NeitherCountNorResetTransportErrors) {
    for (int i = 0; i < 4; ++i) {
        consumer_->addError();
    }
    consumer_->addTimeout().addTimeout();

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(engine->consecutiveTransportErrors(), 4u);
    EXPECT_EQ(engine->stats().transportErrors, 4u);
}

TEST_F(DispatchEngineTest, HandlerFailure_StillResetsTransportErrors) {
    for (int i = 0; i < 4; ++i) {
        consumer_->addError();
    }
    consumer_->addMessage(eventJson("e1", "order.created"));
    for (int i = 0; i < 4; ++i) {
        consumer_->addError();
    }

    auto engine = makeEngine(ports::input::makeHandler([](const domain::Event&) {
        throw std::runtime_error("boom");
    }));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(engine->stats().handlerFailures, 1u);
}

TEST_F(DispatchEngineTest, CustomErrorThreshold_IsHonoured) {
    consumer_->addError().addError();

    EngineOptions options;
    options.maxConsecutiveErrors = 2;

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen), options);

    EXPECT_THROW(engine->start(token_), domain::TransportError);
}

// ============================================================================
// OUTPUT ROUTING TESTS
// ============================================================================

TEST_F(DispatchEngineTest, DiscardDestination_NeverPublishes) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, getOutputDestination(_))
        .WillOnce(Return(domain::OutputDestination::discard()));

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event& event) -> std::optional<domain::Event> { return event; }));
    engine->start(token_);

    EXPECT_EQ(publisher_->publishCallCount(), 0);
    EXPECT_EQ(engine->stats().outputsDiscarded, 1u);
}

TEST_F(DispatchEngineTest, UnrecognizedDestination_IsRoutingFailureAndLoopContinues) {
    consumer_->addMessage(eventJson("e1", "order.created"))
        .addMessage(eventJson("e2", "order.created"));

    EXPECT_CALL(*core_, getOutputDestination(_))
        .WillOnce(Return(domain::OutputDestination(static_cast<domain::DestinationType>(7), "x")))
        .WillOnce(Return(domain::OutputDestination(domain::DestinationType::BROKER, "events")));

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event& event) -> std::optional<domain::Event> { return event; }));
    engine->start(token_);

    EXPECT_EQ(engine->stats().routingFailures, 1u);
    ASSERT_EQ(publisher_->publishCallCount(), 1);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].key, "e2");
}

TEST_F(DispatchEngineTest, PublishFailure_IsScopedToOneEvent) {
    consumer_->addMessage(eventJson("e1", "order.created"));
    publisher_->setFailPublish(true);

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event& event) -> std::optional<domain::Event> { return event; }));

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(engine->stats().routingFailures, 1u);
    EXPECT_EQ(engine->stats().outputsPublished, 0u);
}

// ============================================================================
// ROUTING CONFIG TESTS
// ============================================================================

TEST_F(DispatchEngineTest, RoutingFileAbsent_BackendDefaultStillConsulted) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    EXPECT_CALL(*core_, loadRoutingConfig(_)).Times(0);
    EXPECT_CALL(*core_, getOutputDestination(_)).Times(1);

    EngineOptions options;
    options.routingConfigPath = "/nonexistent/dir/routing.yaml";

    auto engine = makeEngine(ports::input::makeHandler(
        [](const domain::Event& event) -> std::optional<domain::Event> { return event; }), options);
    engine->start(token_);

    ASSERT_EQ(publisher_->publishCallCount(), 1);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].target, "events");
    EXPECT_EQ(publisher_->getPublishedMessages()[0].cluster, std::optional<std::string>("default"));
}

TEST_F(DispatchEngineTest, RoutingFilePresent_IsLoadedOnce) {
    const std::string path = std::string(EDA_TEST_FIXTURES_DIR) + "/routing.yaml";
    EXPECT_CALL(*core_, loadRoutingConfig(path)).Times(1);

    EngineOptions options;
    options.routingConfigPath = path;

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen), options);
    engine->start(token_);
}

TEST_F(DispatchEngineTest, RoutingLoadFailure_IsWarningWhenNotRequired) {
    EXPECT_CALL(*core_, loadRoutingConfig(_)).WillOnce(Throw(domain::CoreError("bad yaml")));

    EngineOptions options;
    options.routingConfigPath = std::string(EDA_TEST_FIXTURES_DIR) + "/invalid_routing.yaml";

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen), options);

    EXPECT_NO_THROW(engine->configure());
    EXPECT_EQ(engine->state(), domain::EngineState::CONFIGURED);
}

TEST_F(DispatchEngineTest, RoutingLoadFailure_IsFatalWhenRequired) {
    EXPECT_CALL(*core_, loadRoutingConfig(_)).WillOnce(Throw(domain::CoreError("bad yaml")));

    EngineOptions options;
    options.routingConfigPath = std::string(EDA_TEST_FIXTURES_DIR) + "/invalid_routing.yaml";
    options.requireRouting = true;

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen), options);

    EXPECT_THROW(engine->configure(), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
    EXPECT_EQ(consumersCreated_, 0);
    EXPECT_GE(log_->indexOf("core.close"), 0);
}

// ============================================================================
// STARTUP FAILURE TESTS
// ============================================================================

TEST_F(DispatchEngineTest, EmptyHandler_FailsBeforeBrokerConnection) {
    auto engine = makeEngine(ports::input::Handler(ports::input::SimpleHandler()));

    EXPECT_THROW(engine->start(token_), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
    EXPECT_EQ(consumersCreated_, 0);
}

TEST_F(DispatchEngineTest, EmptyBroker_FailsFast) {
    ON_CALL(*core_, getConnectionConfig())
        .WillByDefault(Return(domain::ConnectionConfig("", "events", "poc")));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->start(token_), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
    EXPECT_EQ(consumersCreated_, 0);
    EXPECT_GE(log_->indexOf("core.close"), 0);
}

TEST_F(DispatchEngineTest, ConnectionConfigFailure_IsConfigurationError) {
    ON_CALL(*core_, getConnectionConfig())
        .WillByDefault(Throw(domain::CoreError("no config")));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->configure(), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
}

TEST_F(DispatchEngineTest, CoreFactoryFailure_IsConfigurationError) {
    coreFactoryFails_ = true;

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->start(token_), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
}

TEST_F(DispatchEngineTest, ThrowingStateListener_DoesNotAffectFailedStartup) {
    coreFactoryFails_ = true;

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));
    engine->onStateChange([](domain::EngineState) { throw std::runtime_error("listener exploded"); });

    EXPECT_THROW(engine->start(token_), domain::ConfigurationError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
}

TEST_F(DispatchEngineTest, ThrowingStateListener_DoesNotAffectRun) {
    consumer_->addMessage(eventJson("e1", "order.created"));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));
    engine->onStateChange([](domain::EngineState) { throw 7; });

    EXPECT_NO_THROW(engine->start(token_));
    EXPECT_EQ(seen, std::vector<std::string>({"e1"}));
    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
}

TEST_F(DispatchEngineTest, SubscribeFailure_IsTransportErrorAndReleasesCore) {
    consumer_->failSubscribe(true);

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->start(token_), domain::TransportError);
    EXPECT_EQ(engine->state(), domain::EngineState::FAILED);
    EXPECT_LT(log_->indexOf("consumer.close"), log_->indexOf("core.close"));
}

TEST_F(DispatchEngineTest, Subscribe_UsesTopicAndGroupFromCore) {
    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));
    engine->start(token_);

    EXPECT_TRUE(consumer_->isSubscribed());
    EXPECT_EQ(consumer_->subscribedTopic(), "events");
    EXPECT_EQ(consumer_->subscribedGroup(), "poc");
    EXPECT_EQ(engine->connectionConfig().broker, "localhost:5672");
}

TEST_F(DispatchEngineTest, OperationsOutOfOrder_AreRejected) {
    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    EXPECT_THROW(engine->subscribe(), std::logic_error);
    EXPECT_THROW(engine->run(token_), std::logic_error);
    EXPECT_EQ(engine->state(), domain::EngineState::CREATED);
}

// ============================================================================
// SHUTDOWN TESTS
// ============================================================================

TEST_F(DispatchEngineTest, CancellationDuringHandler_CompletesHandlerThenClosesInOrder) {
    consumer_->addMessage(eventJson("e1", "order.created"))
        .addMessage(eventJson("e2", "order.created"));

    int calls = 0;
    auto engine = makeEngine(ports::input::makeHandler(
        [this, &calls](const domain::Event& event) -> std::optional<domain::Event> {
            ++calls;
            token_.cancel();
            log_->record("handler.done");
            return domain::Event("processed-" + event.id, "order.processed", event.source);
        }));

    std::vector<domain::EngineState> states;
    engine->onStateChange([&states](domain::EngineState state) { states.push_back(state); });

    engine->start(token_);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(publisher_->publishCallCount(), 1);

    int handlerDone = log_->indexOf("handler.done");
    int flush = log_->indexOf("publisher.flush");
    int publisherClose = log_->indexOf("publisher.close");
    int consumerClose = log_->indexOf("consumer.close");
    int coreClose = log_->indexOf("core.close");

    EXPECT_LT(handlerDone, flush);
    EXPECT_LT(flush, publisherClose);
    EXPECT_LT(publisherClose, consumerClose);
    EXPECT_LT(consumerClose, coreClose);

    std::vector<domain::EngineState> expected{
        domain::EngineState::CONFIGURED,
        domain::EngineState::SUBSCRIBED,
        domain::EngineState::RUNNING,
        domain::EngineState::DRAINING,
        domain::EngineState::CLOSED};
    EXPECT_EQ(states, expected);
}

TEST_F(DispatchEngineTest, Close_IsIdempotent) {
    EXPECT_CALL(*core_, close()).Times(1);

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));
    engine->start(token_);

    engine->close();
    engine->close();

    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
    EXPECT_EQ(publisher_->closeCallCount(), 0);
}

TEST_F(DispatchEngineTest, Destructor_ReleasesSubscribedEngine) {
    std::vector<std::string> seen;
    {
        auto engine = makeEngine(recordingHandler(seen));
        engine->configure();
        engine->subscribe();
    }

    EXPECT_GE(log_->indexOf("consumer.close"), 0);
    EXPECT_LT(log_->indexOf("consumer.close"), log_->indexOf("core.close"));
}

TEST_F(DispatchEngineTest, Deadline_StopsLoop) {
    consumer_->onExhausted(nullptr);
    token_.setDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(20));

    std::vector<std::string> seen;
    auto engine = makeEngine(recordingHandler(seen));

    engine->start(token_);

    EXPECT_EQ(engine->state(), domain::EngineState::CLOSED);
    EXPECT_GT(consumer_->pollCallCount(), 0);
}
