// src/protocol/command.h
#pragma once

#include "nlohmann/json.hpp"
#include <string>

namespace pushhub::protocol {

    // Immutable description of one invocable command, published by tools/list.
    struct CommandDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;// JSON Schema
    };

    inline nlohmann::json to_json(const CommandDescriptor &command) {
        nlohmann::json j = {
                {"name", command.name},
                {"description", command.description}};
        if (!command.input_schema.is_null() && !command.input_schema.empty()) {
            j["inputSchema"] = command.input_schema;
        }
        return j;
    }

    // Schema for a command taking two required numbers "a" and "b".
    inline nlohmann::json make_binary_number_schema() {
        return nlohmann::json{
                {"type", "object"},
                {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                {"required", nlohmann::json::array({"a", "b"})}};
    }

}// namespace pushhub::protocol
