#pragma once
#include "command_handler.h"
#include "hub/broadcaster.h"
#include "hub/deferred_notifier.h"
#include "protocol/json_rpc.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pushhub::business {

    /**
     * @brief Collaborators a method handler may use.
     * notifier may be null, in which case the handshake schedules nothing.
     */
    struct DispatchContext {
        std::shared_ptr<CommandHandler> commands;
        std::shared_ptr<hub::Broadcaster> broadcaster;
        std::shared_ptr<hub::DeferredNotifier> notifier;
        std::string server_name = "calculator-server";
    };

    // A handler builds the result; the router stamps the correlation id.
    using RpcHandler = std::function<protocol::Response(
            const protocol::Message &,
            DispatchContext &)>;

    class RpcRouter {
    public:
        void register_handler(const std::string &method, RpcHandler handler);

        std::optional<RpcHandler> find_handler(const std::string &method) const;

        /**
         * @brief Route a request or notification to its handler.
         * Unknown methods answer -32601; a throwing handler answers -32603.
         * The reply carries the message's id, or no id if it had none.
         */
        protocol::Response route_request(const protocol::Message &message, DispatchContext &context) const;

    private:
        std::unordered_map<std::string, RpcHandler> handlers_;
    };

}// namespace pushhub::business
