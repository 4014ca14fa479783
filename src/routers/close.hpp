#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"

namespace pushhub::routers {
    /**
     * @brief Handle close request
     * Queues the close sentinel on every connection registered right now;
     * connections opened afterwards are unaffected.
     */
    inline protocol::Response handle_close(
            const protocol::Message & /*msg*/,
            business::DispatchContext &context) {
        auto report = context.broadcaster->close_all();
        PUSHHUB_INFO("Close requested: signalled {} of {} connection(s)", report.delivered, report.recipients);
        return protocol::Response::success(std::nullopt, nlohmann::json::object());
    }
}// namespace pushhub::routers
