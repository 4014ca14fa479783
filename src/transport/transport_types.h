#pragma once

#include <functional>
#include <memory>
#include <string>

namespace pushhub::transport {

    class Session;

    // Body and status of a plain (non-streaming) HTTP reply. Always JSON.
    struct HttpReply {
        int status_code = 200;
        std::string body;
    };

    // One JSON-RPC body in, one reply out.
    using MessageCallback = std::function<HttpReply(const std::string &)>;

    // Takes over a session for server-push; must return without blocking.
    using StreamCallback = std::function<void(std::shared_ptr<Session>)>;

    using StatusCallback = std::function<HttpReply()>;

    /**
     * @brief Application endpoints the HTTP layer routes to.
     */
    struct Endpoints {
        MessageCallback on_message;///< POST /messages, POST /
        StreamCallback on_stream;  ///< GET /sse
        StatusCallback on_health;  ///< GET /health
        StatusCallback on_debug;   ///< GET /debug/tools
    };

}// namespace pushhub::transport
