// src/business/request_handler.h
#pragma once

#include "business/rpc_router.h"
#include "protocol/json_rpc.h"
#include "transport/transport_types.h"
#include <string>

namespace pushhub::business {

    /**
     * @brief Request dispatcher: decodes one inbound JSON-RPC body, routes
     * it, and encodes the reply for the HTTP layer.
     */
    class RequestHandler {
    public:
        explicit RequestHandler(DispatchContext context);

        /**
         * @brief Handle one POSTed body.
         * @return 200 with the encoded reply, or 500 with the -32603 envelope
         *         when the body cannot be decoded
         */
        transport::HttpReply handle_message(const std::string &body);

        // Route an already decoded request or notification.
        protocol::Response dispatch(const protocol::Message &message);

        DispatchContext &context() { return context_; }

    private:
        DispatchContext context_;
        RpcRouter router_;
    };

}// namespace pushhub::business
