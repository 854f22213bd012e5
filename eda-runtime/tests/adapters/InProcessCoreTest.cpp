#include <gtest/gtest.h>
#include "adapters/secondary/core/InProcessCore.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>

using namespace eda;
using namespace eda::adapters::secondary;

class InProcessCoreTest : public ::testing::Test {
protected:
    std::unique_ptr<InProcessCore> core;

    void SetUp() override {
        setenv("EDA_BROKER", "rabbit.local:5672", 1);
        setenv("EDA_TOPIC", "orders", 1);
        unsetenv("EDA_GROUP");

        core = std::make_unique<InProcessCore>(std::make_shared<settings::ConnectionSettings>());
    }

    void TearDown() override {
        unsetenv("EDA_BROKER");
        unsetenv("EDA_TOPIC");
    }

    std::string fixture(const std::string& name) {
        return std::string(EDA_TEST_FIXTURES_DIR) + "/" + name;
    }

    static std::string envelope(const std::string& type) {
        return domain::Event("out-1", type, "/shop").toJson().dump();
    }
};

// ================================================================
// CONNECTION AND RETRY
// ================================================================

TEST_F(InProcessCoreTest, ConnectionConfig_FromEnvironment) {
    auto config = core->getConnectionConfig();

    EXPECT_EQ(config.broker, "rabbit.local:5672");
    EXPECT_EQ(config.topic, "orders");
    EXPECT_EQ(config.group, "poc");
}

TEST_F(InProcessCoreTest, Retry_NeverRetriesAndNoBackoff) {
    EXPECT_FALSE(core->shouldRetry("boom", 1));
    EXPECT_FALSE(core->shouldRetry("boom", 5));
    EXPECT_EQ(core->calculateBackoff(1), 0u);
}

// ================================================================
// OUTPUT DESTINATIONS
// ================================================================

TEST_F(InProcessCoreTest, WithoutRouting_UsesBuiltInDefault) {
    auto destination = core->getOutputDestination(envelope("order.processed"));

    EXPECT_EQ(destination, InProcessCore::builtInDefaultDestination());
    EXPECT_EQ(destination.target, "events");
    EXPECT_EQ(destination.cluster, std::optional<std::string>("default"));
}

TEST_F(InProcessCoreTest, LoadRouting_RoutesByRules) {
    core->loadRoutingConfig(fixture("routing.yaml"));

    EXPECT_EQ(core->getOutputDestination(envelope("order.processed")).target, "orders.processed");
    EXPECT_EQ(core->getOutputDestination(envelope("x.debug")).type, domain::DestinationType::DISCARD);
    EXPECT_EQ(core->getOutputDestination(envelope("user.login")).target, "fallback");
    EXPECT_EQ(core->routingTable()->ruleCount(), 5u);
}

TEST_F(InProcessCoreTest, LoadRoutingFailure_KeepsPreviousTable) {
    core->loadRoutingConfig(fixture("routing.yaml"));

    EXPECT_THROW(core->loadRoutingConfig(fixture("invalid_routing.yaml")), domain::CoreError);
    EXPECT_THROW(core->loadRoutingConfig(fixture("missing.yaml")), domain::CoreError);

    EXPECT_EQ(core->getOutputDestination(envelope("order.processed")).target, "orders.processed");
}

TEST_F(InProcessCoreTest, InvalidEnvelope_Throws) {
    EXPECT_THROW(core->getOutputDestination("{not json"), domain::CoreError);
    EXPECT_THROW(core->getOutputDestination(R"({"id":"x"})"), domain::CoreError);
}

// ================================================================
// LIFECYCLE
// ================================================================

TEST_F(InProcessCoreTest, Close_RejectsFurtherCalls) {
    core->close();
    core->close();

    EXPECT_TRUE(core->isClosed());
    EXPECT_THROW(core->getConnectionConfig(), domain::CoreError);
    EXPECT_THROW(core->shouldRetry("boom", 1), domain::CoreError);
    EXPECT_THROW(core->getOutputDestination(envelope("x")), domain::CoreError);
}

TEST_F(InProcessCoreTest, NullSettings_Throws) {
    EXPECT_THROW(InProcessCore(nullptr), domain::CoreError);
}
