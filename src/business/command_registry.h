// src/business/command_registry.h
#pragma once

#include "command_handler.h"
#include "protocol/command.h"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pushhub::business {

    // Command execution function signature. Throws on domain errors.
    using CommandExecutor = std::function<nlohmann::json(const nlohmann::json &)>;

    // Command metadata + executor
    struct RegisteredCommand {
        protocol::CommandDescriptor metadata;
        CommandExecutor executor;
    };

    /**
     * @brief CommandHandler backed by a table of executors.
     * Commands are listed in registration order.
     */
    class CommandRegistry : public CommandHandler {
    public:
        void register_command(const protocol::CommandDescriptor &command, CommandExecutor exec);

        std::vector<std::string> get_all_command_names() const;
        std::vector<protocol::CommandDescriptor> list_commands() const override;
        InvokeResult invoke(const std::string &name, const nlohmann::json &args) override;

    private:
        mutable std::mutex mutex_;
        std::vector<RegisteredCommand> commands_;
        std::unordered_map<std::string, size_t> index_;
    };

}// namespace pushhub::business
