#include "rpc_router.h"
#include "core/logger.h"

namespace pushhub::business {

    /**
     * @brief Register RPC method handler
     * @param method RPC method name
     * @param handler Handler function for the method
     */
    void RpcRouter::register_handler(const std::string &method, RpcHandler handler) {
        handlers_[method] = std::move(handler);
    }

    /**
     * @brief Find registered handler for a method
     * @param method RPC method name
     * @return Optional handler if found
     */
    std::optional<RpcHandler> RpcRouter::find_handler(const std::string &method) const {
        auto it = handlers_.find(method);
        return (it != handlers_.end()) ? std::optional<RpcHandler>(it->second) : std::nullopt;
    }

    protocol::Response RpcRouter::route_request(const protocol::Message &message, DispatchContext &context) const {
        const std::string &method = protocol::method_of(message);
        auto id = protocol::correlation_id(message);

        auto handler = find_handler(method);
        if (!handler.has_value()) {
            PUSHHUB_WARN("Unknown method: {}", method);
            return protocol::Response::failure(
                    id, protocol::Error{protocol::error_code::METHOD_NOT_FOUND, "Method not found: " + method});
        }

        try {
            auto response = handler.value()(message, context);
            response.id = id;
            return response;
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("Handler for {} failed: {}", method, e.what());
            return protocol::Response::failure(
                    id, protocol::Error{protocol::error_code::INTERNAL_ERROR, std::string("Internal error: ") + e.what()});
        }
    }

}// namespace pushhub::business
