#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"

namespace pushhub::routers {
    // Client finished the handshake: announce the command list shortly after.
    inline protocol::Response handle_initialized(
            const protocol::Message & /*msg*/,
            business::DispatchContext &context) {
        PUSHHUB_INFO("Client initialized");
        if (context.notifier) {
            context.notifier->schedule_list_changed();
        }
        return protocol::Response::success(std::nullopt, nlohmann::json::object());
    }
}// namespace pushhub::routers
