#include "business/calculator_commands.h"
#include "business/command_registry.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace pushhub::business;
using json = nlohmann::json;

class CalculatorCommandsTest : public ::testing::Test {
protected:
    void SetUp() override { registry = make_calculator_registry(); }

    std::shared_ptr<CommandRegistry> registry;
};

TEST_F(CalculatorCommandsTest, ListsCommandsInRegistrationOrder) {
    auto commands = registry->list_commands();
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[0].name, "add");
    EXPECT_EQ(commands[1].name, "subtract");
    EXPECT_EQ(commands[2].name, "multiply");
    EXPECT_EQ(commands[3].name, "divide");
    EXPECT_EQ(commands[0].input_schema["required"], json::array({"a", "b"}));
}

TEST_F(CalculatorCommandsTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(registry->invoke("add", {{"a", 2}, {"b", 3}}).value.get<double>(), 5.0);
    EXPECT_DOUBLE_EQ(registry->invoke("subtract", {{"a", 2}, {"b", 3}}).value.get<double>(), -1.0);
    EXPECT_DOUBLE_EQ(registry->invoke("multiply", {{"a", 2.5}, {"b", 4}}).value.get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(registry->invoke("divide", {{"a", 7}, {"b", 2}}).value.get<double>(), 3.5);
}

TEST_F(CalculatorCommandsTest, AcceptsNumericStrings) {
    auto result = registry->invoke("add", {{"a", "1.5"}, {"b", "2"}});
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.value.get<double>(), 3.5);
}

TEST_F(CalculatorCommandsTest, DivisionByZeroIsAnError) {
    auto result = registry->invoke("divide", {{"a", 1}, {"b", 0}});
    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("Division by zero"), std::string::npos);
}

TEST_F(CalculatorCommandsTest, BadArgumentsAreErrors) {
    auto missing = registry->invoke("add", {{"a", 1}});
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(*missing.error, "Missing required argument: b");

    auto not_number = registry->invoke("add", {{"a", "one"}, {"b", 1}});
    ASSERT_FALSE(not_number.ok());
    EXPECT_EQ(*not_number.error, "Argument 'a' must be a number");

    auto trailing = registry->invoke("add", {{"a", "1x"}, {"b", 1}});
    EXPECT_FALSE(trailing.ok());
}

TEST_F(CalculatorCommandsTest, UnknownCommand) {
    auto result = registry->invoke("frobnicate", json::object());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, "Unknown command: frobnicate");
}

TEST(CommandRegistryTest, ReRegistrationKeepsPosition) {
    CommandRegistry registry;
    registry.register_command({"first", "one", json::object()}, [](const json &) { return json(1); });
    registry.register_command({"second", "two", json::object()}, [](const json &) { return json(2); });
    registry.register_command({"first", "uno", json::object()}, [](const json &) { return json(11); });

    auto names = registry.get_all_command_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "first");
    EXPECT_EQ(registry.list_commands()[0].description, "uno");
    EXPECT_EQ(registry.invoke("first", json::object()).value, 11);
}

TEST(CommandRegistryTest, ThrowingExecutorBecomesFailure) {
    CommandRegistry registry;
    registry.register_command({"boom", "throws", json::object()},
                              [](const json &) -> json { throw std::runtime_error("exploded"); });
    auto result = registry.invoke("boom", json::object());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, "exploded");
}
