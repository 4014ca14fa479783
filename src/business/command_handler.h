// src/business/command_handler.h
#pragma once

#include "protocol/command.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pushhub::business {

    /**
     * @brief Outcome of one command invocation: either a value or a
     * human-readable error. Never both.
     */
    struct InvokeResult {
        nlohmann::json value = nlohmann::json(nullptr);
        std::optional<std::string> error;

        bool ok() const { return !error.has_value(); }

        static InvokeResult success(nlohmann::json value) {
            return InvokeResult{std::move(value), std::nullopt};
        }

        static InvokeResult failure(std::string message) {
            return InvokeResult{nlohmann::json(nullptr), std::move(message)};
        }
    };

    /**
     * @brief Domain collaborator resolving a command name and arguments to a result.
     * Implementations must report every failure through InvokeResult; a failing
     * command is never fatal to the caller.
     */
    class CommandHandler {
    public:
        virtual ~CommandHandler() = default;

        // Statically configured descriptors, in a stable order.
        virtual std::vector<protocol::CommandDescriptor> list_commands() const = 0;

        virtual InvokeResult invoke(const std::string &name, const nlohmann::json &args) = 0;
    };

}// namespace pushhub::business
