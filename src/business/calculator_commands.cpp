#include "calculator_commands.h"
#include "core/logger.h"
#include <stdexcept>
#include <string>

namespace pushhub::business {

    namespace {
        // Accepts a JSON number or a string holding a complete decimal number.
        double number_argument(const nlohmann::json &args, const char *key) {
            if (!args.is_object() || !args.contains(key)) {
                throw std::invalid_argument(std::string("Missing required argument: ") + key);
            }
            const auto &value = args[key];
            if (value.is_number()) {
                return value.get<double>();
            }
            if (value.is_string()) {
                const auto &text = value.get_ref<const std::string &>();
                try {
                    size_t consumed = 0;
                    double parsed = std::stod(text, &consumed);
                    if (consumed == text.size()) {
                        return parsed;
                    }
                } catch (const std::exception &) {
                    // fall through to the error below
                }
            }
            throw std::invalid_argument(std::string("Argument '") + key + "' must be a number");
        }

        template<typename Op>
        CommandExecutor binary(Op op) {
            return [op](const nlohmann::json &args) -> nlohmann::json {
                double a = number_argument(args, "a");
                double b = number_argument(args, "b");
                return op(a, b);
            };
        }
    }// namespace

    void register_calculator_commands(CommandRegistry &registry) {
        auto schema = protocol::make_binary_number_schema();

        registry.register_command({"add", "Add two numbers together", schema},
                                  binary([](double a, double b) { return a + b; }));
        registry.register_command({"subtract", "Subtract second number from first", schema},
                                  binary([](double a, double b) { return a - b; }));
        registry.register_command({"multiply", "Multiply two numbers", schema},
                                  binary([](double a, double b) { return a * b; }));
        registry.register_command({"divide", "Divide first number by second", schema},
                                  binary([](double a, double b) {
                                      if (b == 0) {
                                          throw std::domain_error("Division by zero is not allowed");
                                      }
                                      return a / b;
                                  }));

        PUSHHUB_INFO("Registered {} calculator commands", registry.get_all_command_names().size());
    }

    std::shared_ptr<CommandRegistry> make_calculator_registry() {
        auto registry = std::make_shared<CommandRegistry>();
        register_calculator_commands(*registry);
        return registry;
    }

}// namespace pushhub::business
