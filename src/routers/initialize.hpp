#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <version.h>

namespace pushhub::routers {

    constexpr const char *DEFAULT_PROTOCOL_VERSION = "2024-11-05";

    /**
     * @brief Handle initialization request
     * Starts the direct tools list push when the notifier has it enabled.
     * @return Response with server capabilities and version info
     */
    inline protocol::Response handle_initialize(
            const protocol::Message &msg,
            business::DispatchContext &context) {
        const auto &params = protocol::params_of(msg);

        // echo the client's protocol version
        std::string protocol_version = DEFAULT_PROTOCOL_VERSION;
        if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            protocol_version = params["protocolVersion"].get<std::string>();
        }
        PUSHHUB_INFO("Client initializing with protocol version {}", protocol_version);

        if (context.notifier) {
            context.notifier->schedule_direct_list();
        }

        return protocol::Response::success(std::nullopt, nlohmann::json{
                {"protocolVersion", protocol_version},
                {"serverInfo", {{"name", context.server_name}, {"version", PROJECT_VERSION}}},
                {"capabilities", {{"tools", {{"listChanged", true}}}}}});
    }
}// namespace pushhub::routers
