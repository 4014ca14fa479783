#include "command_registry.h"
#include "core/logger.h"

namespace pushhub::business {

    void CommandRegistry::register_command(const protocol::CommandDescriptor &command, CommandExecutor exec) {
        if (command.name.empty()) {
            PUSHHUB_ERROR("Invalid command name (empty)");
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(command.name);
        if (it != index_.end()) {
            PUSHHUB_WARN("Command '{}' already exists, overwriting", command.name);
            commands_[it->second] = {command, std::move(exec)};
            return;
        }
        index_[command.name] = commands_.size();
        commands_.push_back({command, std::move(exec)});
        PUSHHUB_TRACE("Registered command: {} (registry size: {})", command.name, commands_.size());
    }

    InvokeResult CommandRegistry::invoke(const std::string &name, const nlohmann::json &args) {
        CommandExecutor executor;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(name);
            if (it == index_.end()) {
                PUSHHUB_WARN("Command not found: '{}'", name);
                return InvokeResult::failure("Unknown command: " + name);
            }
            executor = commands_[it->second].executor;
        }

        try {
            return InvokeResult::success(executor(args));
        } catch (const std::exception &e) {
            PUSHHUB_DEBUG("Command '{}' failed: {}", name, e.what());
            return InvokeResult::failure(e.what());
        }
    }

    std::vector<std::string> CommandRegistry::get_all_command_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(commands_.size());
        for (const auto &command: commands_) {
            names.push_back(command.metadata.name);
        }
        return names;
    }

    std::vector<protocol::CommandDescriptor> CommandRegistry::list_commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<protocol::CommandDescriptor> all_commands;
        all_commands.reserve(commands_.size());
        for (const auto &command: commands_) {
            all_commands.push_back(command.metadata);
        }
        return all_commands;
    }

}// namespace pushhub::business
