#include "business/calculator_commands.h"
#include "hub/deferred_notifier.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace pushhub::hub;
using pushhub::testing::run_awaitable;
using json = nlohmann::json;
using namespace std::chrono_literals;

class DeferredNotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ConnectionRegistry>();
        broadcaster = std::make_shared<Broadcaster>(registry);
        options.list_changed_delay = 20ms;
        options.direct_list_delay = 20ms;
        options.direct_list_followup = 10ms;
    }

    std::shared_ptr<DeferredNotifier> make_notifier() {
        return std::make_shared<DeferredNotifier>(io.get_executor(), broadcaster,
                                                  pushhub::business::make_calculator_registry(), options);
    }

    json pull_json(ConnectionId id) {
        auto result = run_awaitable(io, registry->find(id)->pull(100ms));
        EXPECT_EQ(result.status, PullStatus::MESSAGE);
        return result.status == PullStatus::MESSAGE ? json::parse(result.payload) : json();
    }

    asio::io_context io;
    std::shared_ptr<ConnectionRegistry> registry;
    std::shared_ptr<Broadcaster> broadcaster;
    NotifierOptions options;
};

TEST_F(DeferredNotifierTest, ListChangedAfterDelay) {
    auto id = registry->register_connection(io.get_executor());
    auto notifier = make_notifier();

    auto start = std::chrono::steady_clock::now();
    auto delivered = run_awaitable(io, notifier->run_list_changed());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    EXPECT_EQ(delivered, 1u);

    auto message = pull_json(id);
    EXPECT_EQ(message["method"], TOOLS_LIST_CHANGED);
    EXPECT_FALSE(message.contains("id"));
}

TEST_F(DeferredNotifierTest, DirectListSequence) {
    auto id = registry->register_connection(io.get_executor());
    auto notifier = make_notifier();

    auto delivered = run_awaitable(io, notifier->run_direct_list());
    EXPECT_EQ(delivered, 3u);

    EXPECT_EQ(pull_json(id)["method"], TOOLS_LIST_CHANGED);

    auto first = pull_json(id);
    EXPECT_EQ(first["id"], "tools-list-push");
    ASSERT_TRUE(first["result"]["tools"].is_array());
    EXPECT_EQ(first["result"]["tools"].size(), 4u);
    EXPECT_EQ(first["result"]["tools"][0]["name"], "add");

    auto second = pull_json(id);
    EXPECT_EQ(second["id"], 1);
    EXPECT_EQ(second["result"], first["result"]);
}

TEST_F(DeferredNotifierTest, DirectListWithoutConnectionsCompletes) {
    auto notifier = make_notifier();
    EXPECT_EQ(run_awaitable(io, notifier->run_direct_list()), 0u);
}

TEST_F(DeferredNotifierTest, ScheduledTaskRunsDetached) {
    auto id = registry->register_connection(io.get_executor());
    auto notifier = make_notifier();

    notifier->schedule_list_changed();
    io.run();
    io.restart();

    EXPECT_EQ(registry->find(id)->depth(), 1u);
    EXPECT_EQ(pull_json(id)["method"], TOOLS_LIST_CHANGED);
}

TEST_F(DeferredNotifierTest, DirectListCanBeDisabled) {
    options.direct_list_enabled = false;
    auto id = registry->register_connection(io.get_executor());
    auto notifier = make_notifier();

    EXPECT_FALSE(notifier->schedule_direct_list());
    io.run();
    EXPECT_EQ(registry->find(id)->depth(), 0u);
}

TEST_F(DeferredNotifierTest, ConnectionGoneBeforeDelayIsHarmless) {
    auto id = registry->register_connection(io.get_executor());
    auto notifier = make_notifier();
    notifier->schedule_direct_list();
    registry->unregister_connection(id);

    io.run();
    EXPECT_EQ(registry->size(), 0u);
}
