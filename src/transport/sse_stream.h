// src/transport/sse_stream.h
#pragma once

#include "hub/connection_registry.h"
#include "session.h"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace pushhub::transport {

    struct StreamOptions {
        std::chrono::milliseconds heartbeat_interval{25000};
        bool send_connect_event = true;
    };

    enum class StreamState {
        STREAMING,
        CLOSED
    };

    /**
     * @brief Serves one Server-Sent Events stream per session.
     *
     * A stream registers a connection, writes the SSE preamble and then
     * relays its delivery channel to the client, writing a keep-alive
     * comment whenever the channel stays silent for a heartbeat interval.
     * It ends on the close sentinel, on client disconnect or on a failed
     * write, and always unregisters its connection exactly once.
     */
    class SseStream {
    public:
        explicit SseStream(std::shared_ptr<hub::ConnectionRegistry> registry, StreamOptions options = {});

        /**
         * @brief Run the stream until it is closed. Must run on the session's executor.
         * @param session Session taken over for streaming
         * @return Identity the connection had while registered
         */
        asio::awaitable<hub::ConnectionId> run(std::shared_ptr<Session> session);

        /**
         * @brief co_spawn run() on the session's executor and return.
         */
        void spawn(std::shared_ptr<Session> session);

        const StreamOptions &options() const { return options_; }

        static constexpr const char *KEEP_ALIVE = ":\n\n";
        // Shorter heartbeat intervals are raised to this.
        static constexpr std::chrono::milliseconds MIN_HEARTBEAT_INTERVAL{10};
        static std::string response_head();
        static std::string data_frame(const std::string &payload);

    private:
        std::shared_ptr<hub::ConnectionRegistry> registry_;
        StreamOptions options_;
    };

}// namespace pushhub::transport
