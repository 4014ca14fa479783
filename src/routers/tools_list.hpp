#pragma once
#include "business/rpc_router.h"
#include "protocol/command.h"
#include "protocol/json_rpc.h"

namespace pushhub::routers {
    /**
     * @brief Handle tool list request
     * @return Response with the command descriptors, in the handler's order
     */
    inline protocol::Response handle_tools_list(
            const protocol::Message & /*msg*/,
            business::DispatchContext &context) {
        nlohmann::json tools_json = nlohmann::json::array();
        for (const auto &command: context.commands->list_commands()) {
            tools_json.push_back(protocol::to_json(command));
        }
        return protocol::Response::success(std::nullopt, nlohmann::json{{"tools", tools_json}});
    }
}// namespace pushhub::routers
