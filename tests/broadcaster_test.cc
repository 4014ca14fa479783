#include "hub/broadcaster.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace pushhub::hub;
using pushhub::testing::run_awaitable;
using json = nlohmann::json;
using namespace std::chrono_literals;
namespace protocol = pushhub::protocol;

class BroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ConnectionRegistry>();
        broadcaster = std::make_shared<Broadcaster>(registry);
    }

    PullResult pull(ConnectionId id, std::chrono::milliseconds timeout = 50ms) {
        auto channel = registry->find(id);
        if (!channel) {
            return PullResult{PullStatus::CLOSED, {}};
        }
        return run_awaitable(io, channel->pull(timeout));
    }

    asio::io_context io;
    std::shared_ptr<ConnectionRegistry> registry;
    std::shared_ptr<Broadcaster> broadcaster;
};

TEST_F(BroadcasterTest, EveryConnectionGetsMessagesInOrder) {
    auto a = registry->register_connection(io.get_executor());
    auto b = registry->register_connection(io.get_executor());

    auto first = broadcaster->broadcast(protocol::make_notification("first"));
    broadcaster->broadcast(protocol::make_notification("second"));
    EXPECT_EQ(first.recipients, 2u);
    EXPECT_EQ(first.delivered, 2u);
    EXPECT_EQ(first.failed, 0u);

    for (auto id: {a, b}) {
        auto m1 = pull(id);
        auto m2 = pull(id);
        ASSERT_EQ(m1.status, PullStatus::MESSAGE);
        ASSERT_EQ(m2.status, PullStatus::MESSAGE);
        EXPECT_EQ(json::parse(m1.payload)["method"], "first");
        EXPECT_EQ(json::parse(m2.payload)["method"], "second");
    }
}

TEST_F(BroadcasterTest, EmptyRegistryIsANoOp) {
    auto report = broadcaster->broadcast(protocol::make_notification("nobody"));
    EXPECT_EQ(report.recipients, 0u);
    EXPECT_EQ(report.delivered, 0u);
    EXPECT_EQ(report.failed, 0u);
}

TEST_F(BroadcasterTest, NotRetroactive) {
    broadcaster->broadcast(protocol::make_notification("early"));
    auto late = registry->register_connection(io.get_executor());
    EXPECT_EQ(pull(late, 10ms).status, PullStatus::TIMED_OUT);
}

TEST_F(BroadcasterTest, OneFailingRecipientDoesNotStopOthers) {
    auto closing = registry->register_connection(io.get_executor());
    auto healthy = registry->register_connection(io.get_executor());
    registry->push_close(closing);

    auto report = broadcaster->broadcast_raw(R"({"jsonrpc":"2.0","method":"x"})");
    EXPECT_EQ(report.recipients, 2u);
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(pull(healthy).payload, R"({"jsonrpc":"2.0","method":"x"})");
}

TEST_F(BroadcasterTest, CloseAllOnlyAffectsRegisteredConnections) {
    auto before = registry->register_connection(io.get_executor());
    auto report = broadcaster->close_all();
    EXPECT_EQ(report.delivered, 1u);

    auto after = registry->register_connection(io.get_executor());
    broadcaster->broadcast(protocol::make_notification("still-open"));

    EXPECT_EQ(pull(before).status, PullStatus::CLOSED);
    auto result = pull(after);
    ASSERT_EQ(result.status, PullStatus::MESSAGE);
    EXPECT_EQ(json::parse(result.payload)["method"], "still-open");
}

TEST(BroadcasterConstructionTest, RejectsNullRegistry) {
    EXPECT_THROW({ Broadcaster broadcaster(nullptr); }, std::invalid_argument);
}
