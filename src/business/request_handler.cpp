#include "request_handler.h"
#include "core/logger.h"
#include "routers/close.hpp"
#include "routers/initialize.hpp"
#include "routers/initialized.hpp"
#include "routers/tools_call.hpp"
#include "routers/tools_list.hpp"
#include <stdexcept>

namespace pushhub::business {

    namespace {
        bool is_initialized(const std::string &method) {
            return method == "initialized" || method == "notifications/initialized";
        }
    }// namespace

    using namespace routers;
    RequestHandler::RequestHandler(DispatchContext context)
        : context_(std::move(context)) {
        if (!context_.commands) {
            throw std::invalid_argument("CommandHandler cannot be null");
        }
        if (!context_.broadcaster) {
            throw std::invalid_argument("Broadcaster cannot be null");
        }

        router_.register_handler("initialize", handle_initialize);
        router_.register_handler("initialized", handle_initialized);
        router_.register_handler("notifications/initialized", handle_initialized);
        router_.register_handler("tools/list", handle_tools_list);
        router_.register_handler("tools/call", handle_tools_call);
        router_.register_handler("close", handle_close);
        router_.register_handler("ping", [](const protocol::Message &, DispatchContext &) {
            PUSHHUB_DEBUG("Received ping request");
            return protocol::Response::success(std::nullopt, nlohmann::json::object());
        });
    }

    protocol::Response RequestHandler::dispatch(const protocol::Message &message) {
        return router_.route_request(message, context_);
    }

    transport::HttpReply RequestHandler::handle_message(const std::string &body) {
        PUSHHUB_DEBUG("Raw message: {}", body);
        auto [message, decode_error] = protocol::decode_message(body);

        if (!message.has_value()) {
            std::string detail = decode_error.has_value() ? decode_error->message : "undecodable message";
            PUSHHUB_ERROR("Rejecting inbound message: {}", detail);
            return {500, protocol::make_internal_error(detail)};
        }

        // A reply from the client: nothing to dispatch
        if (std::holds_alternative<protocol::Response>(*message)) {
            PUSHHUB_INFO("Received response from client: {}", body);
            return {200, "{}"};
        }

        const std::string &method = protocol::method_of(*message);
        PUSHHUB_INFO("Received method: {}", method);

        auto response = dispatch(*message);
        if (is_initialized(method) && !response.is_error()) {
            return {200, "{}"};
        }
        return {200, protocol::encode(response)};
    }

}// namespace pushhub::business
