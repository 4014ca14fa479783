#include "hub/delivery_channel.h"
#include "test_support.h"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace pushhub::hub;
using pushhub::testing::run_awaitable;
using namespace std::chrono_literals;

class DeliveryChannelTest : public ::testing::Test {
protected:
    std::shared_ptr<DeliveryChannel> make_channel(size_t capacity = 256,
                                                  OverflowPolicy policy = OverflowPolicy::DROP_OLDEST) {
        return std::make_shared<DeliveryChannel>(io.get_executor(), ChannelOptions{capacity, policy});
    }

    PullResult pull(const std::shared_ptr<DeliveryChannel> &channel, std::chrono::milliseconds timeout = 50ms) {
        return run_awaitable(io, channel->pull(timeout));
    }

    asio::io_context io;
};

TEST_F(DeliveryChannelTest, DeliversInPushOrder) {
    auto channel = make_channel();
    EXPECT_EQ(channel->push("a"), PushOutcome::ACCEPTED);
    EXPECT_EQ(channel->push("b"), PushOutcome::ACCEPTED);
    EXPECT_EQ(channel->push("c"), PushOutcome::ACCEPTED);
    EXPECT_EQ(channel->depth(), 3u);

    for (const char *expected: {"a", "b", "c"}) {
        auto result = pull(channel);
        ASSERT_EQ(result.status, PullStatus::MESSAGE);
        EXPECT_EQ(result.payload, expected);
    }
    EXPECT_EQ(channel->depth(), 0u);
}

TEST_F(DeliveryChannelTest, TimesOutWhenIdle) {
    auto channel = make_channel();
    auto start = std::chrono::steady_clock::now();
    auto result = pull(channel, 30ms);
    EXPECT_EQ(result.status, PullStatus::TIMED_OUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST_F(DeliveryChannelTest, PushFromAnotherThreadWakesPull) {
    auto channel = make_channel();
    std::thread producer([channel]() {
        std::this_thread::sleep_for(20ms);
        channel->push("late");
    });

    auto start = std::chrono::steady_clock::now();
    auto result = pull(channel, 5s);
    producer.join();

    ASSERT_EQ(result.status, PullStatus::MESSAGE);
    EXPECT_EQ(result.payload, "late");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}

TEST_F(DeliveryChannelTest, CloseSentinelComesAfterPendingMessages) {
    auto channel = make_channel();
    channel->push("first");
    EXPECT_TRUE(channel->push_close());
    EXPECT_TRUE(channel->is_closing());
    EXPECT_EQ(channel->push("after-close"), PushOutcome::REJECTED_CLOSED);
    EXPECT_FALSE(channel->push_close());

    auto first = pull(channel);
    ASSERT_EQ(first.status, PullStatus::MESSAGE);
    EXPECT_EQ(first.payload, "first");
    EXPECT_EQ(pull(channel).status, PullStatus::CLOSED);
}

TEST_F(DeliveryChannelTest, DropOldestWhenFull) {
    auto channel = make_channel(2, OverflowPolicy::DROP_OLDEST);
    EXPECT_EQ(channel->push("1"), PushOutcome::ACCEPTED);
    EXPECT_EQ(channel->push("2"), PushOutcome::ACCEPTED);
    EXPECT_EQ(channel->push("3"), PushOutcome::DROPPED_OLDEST);
    EXPECT_EQ(channel->depth(), 2u);

    EXPECT_EQ(pull(channel).payload, "2");
    EXPECT_EQ(pull(channel).payload, "3");
}

TEST_F(DeliveryChannelTest, RejectNewWhenFull) {
    auto channel = make_channel(2, OverflowPolicy::REJECT_NEW);
    channel->push("1");
    channel->push("2");
    EXPECT_EQ(channel->push("3"), PushOutcome::REJECTED_FULL);

    EXPECT_EQ(pull(channel).payload, "1");
    EXPECT_EQ(pull(channel).payload, "2");
    EXPECT_EQ(pull(channel, 10ms).status, PullStatus::TIMED_OUT);
}

TEST_F(DeliveryChannelTest, CloseSentinelIgnoresCapacity) {
    auto channel = make_channel(1, OverflowPolicy::REJECT_NEW);
    channel->push("only");
    EXPECT_TRUE(channel->push_close());
    EXPECT_EQ(pull(channel).payload, "only");
    EXPECT_EQ(pull(channel).status, PullStatus::CLOSED);
}

TEST_F(DeliveryChannelTest, CancelWakesPendingPull) {
    auto channel = make_channel();
    channel->push("dropped");
    std::thread canceller([channel]() {
        std::this_thread::sleep_for(20ms);
        channel->cancel();
    });

    // The queued message is consumed first; the next pull blocks until cancel
    EXPECT_EQ(pull(channel).payload, "dropped");
    auto result = pull(channel, 5s);
    canceller.join();

    EXPECT_EQ(result.status, PullStatus::CLOSED);
    EXPECT_EQ(channel->push("x"), PushOutcome::REJECTED_CLOSED);
}

TEST_F(DeliveryChannelTest, CancelDropsQueuedMessages) {
    auto channel = make_channel();
    channel->push("a");
    channel->push("b");
    channel->cancel();
    EXPECT_EQ(channel->depth(), 0u);
    EXPECT_EQ(pull(channel).status, PullStatus::CLOSED);
}

TEST(OverflowPolicyTest, ParsesNames) {
    EXPECT_EQ(parse_overflow_policy("drop_oldest"), OverflowPolicy::DROP_OLDEST);
    EXPECT_EQ(parse_overflow_policy("reject"), OverflowPolicy::REJECT_NEW);
    EXPECT_EQ(parse_overflow_policy("reject_new"), OverflowPolicy::REJECT_NEW);
    EXPECT_EQ(parse_overflow_policy("bogus"), OverflowPolicy::DROP_OLDEST);
}
