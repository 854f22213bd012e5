#include <gtest/gtest.h>
#include "adapters/secondary/events/DeliveryQueue.hpp"
#include <thread>

using namespace eda;
using namespace eda::adapters::secondary;
using ports::output::PollResult;

namespace {

PollResult delivery(const std::string& body) {
    domain::BrokerMessage message;
    message.topic = "events";
    message.body = body;
    return PollResult::received(std::move(message));
}

} // namespace

TEST(DeliveryQueueTest, PopFor_ReturnsInFifoOrder) {
    DeliveryQueue queue;
    queue.push(delivery("first"));
    queue.push(PollResult::transportError("channel closed"));

    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->result.status, PollResult::Status::MESSAGE);
    EXPECT_EQ(first->result.message->body, "first");

    auto second = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->result.status, PollResult::Status::TRANSPORT_ERROR);
    EXPECT_EQ(second->result.error, "channel closed");
}

TEST(DeliveryQueueTest, PopFor_TimesOutWhenEmpty) {
    DeliveryQueue queue;

    auto start = std::chrono::steady_clock::now();
    auto item = queue.popFor(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(item.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(25));
}

TEST(DeliveryQueueTest, PopFor_WakesOnPushFromAnotherThread) {
    DeliveryQueue queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(delivery("late"));
    });

    auto item = queue.popFor(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->result.message->body, "late");
}

TEST(DeliveryQueueTest, Shutdown_WakesWaiterAndDropsFurtherPushes) {
    DeliveryQueue queue;

    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.shutdown();
    });

    auto start = std::chrono::steady_clock::now();
    auto item = queue.popFor(std::chrono::seconds(5));
    closer.join();

    EXPECT_FALSE(item.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(queue.isShutdown());

    queue.push(delivery("ignored"));
    EXPECT_EQ(queue.size(), 0u);
}

TEST(DeliveryQueueTest, Shutdown_RemainingItemsStillDrain) {
    DeliveryQueue queue;
    queue.push(delivery("pending"));
    queue.shutdown();

    auto item = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->result.message->body, "pending");
    EXPECT_FALSE(queue.popFor(std::chrono::milliseconds(10)).has_value());
}

TEST(DeliveryQueueTest, PushCarriesDeliveryTag) {
    DeliveryQueue queue;
    queue.push(delivery("tagged"), 42);
    queue.push(PollResult::transportError("consumer cancelled"));

    auto tagged = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(tagged.has_value());
    EXPECT_EQ(tagged->deliveryTag, 42u);

    auto error = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->deliveryTag, 0u);
}

// ================================================================
// CONNECTION LOSS
// ================================================================

TEST(DeliveryQueueTest, Fail_ErrorRepeatsOnEveryPop) {
    DeliveryQueue queue;
    queue.fail("connection error: reset by peer");

    for (int i = 0; i < 5; ++i) {
        auto item = queue.popFor(std::chrono::seconds(5));
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(item->result.status, PollResult::Status::TRANSPORT_ERROR);
        EXPECT_EQ(item->result.error, "connection error: reset by peer");
    }
    EXPECT_EQ(queue.failure(), std::optional<std::string>("connection error: reset by peer"));
}

TEST(DeliveryQueueTest, Fail_PendingDeliveriesDrainFirstAndFirstErrorWins) {
    DeliveryQueue queue;
    queue.push(delivery("before"), 7);
    queue.fail("channel error: closed");
    queue.fail("connection error: later");
    queue.push(delivery("after"), 8);

    auto first = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->result.message->body, "before");

    auto second = queue.popFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->result.status, PollResult::Status::TRANSPORT_ERROR);
    EXPECT_EQ(second->result.error, "channel error: closed");
    EXPECT_EQ(queue.size(), 0u);
}

TEST(DeliveryQueueTest, Fail_WakesWaiter) {
    DeliveryQueue queue;

    std::thread io([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.fail("connection error: reset");
    });

    auto start = std::chrono::steady_clock::now();
    auto item = queue.popFor(std::chrono::seconds(5));
    io.join();

    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->result.status, PollResult::Status::TRANSPORT_ERROR);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(DeliveryQueueTest, Fail_AfterShutdownIsIgnored) {
    DeliveryQueue queue;
    queue.shutdown();
    queue.fail("connection error: reset");

    EXPECT_FALSE(queue.failure().has_value());
    EXPECT_FALSE(queue.popFor(std::chrono::milliseconds(10)).has_value());
}
