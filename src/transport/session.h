#pragma once

#include "transport_types.h"
#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace pushhub::transport {
    class HttpHandler;
}// namespace pushhub::transport

namespace pushhub::transport {

    /**
     * @brief Base class for managing single client connections.
     * Handles IO operations only, no business logic.
     */
    class Session : public std::enable_shared_from_this<Session> {
    public:
        virtual ~Session() = default;

        /**
         * @brief Launch the session read loop.
         */
        virtual asio::awaitable<void> start(HttpHandler *handler) = 0;

        /**
         * @brief Send data to the client.
         * A failed write closes the session instead of throwing.
         * @param message The message to send
         */
        virtual asio::awaitable<void> write(const std::string &message) = 0;

        /**
         * @brief Close the session. Runs the close handler once.
         */
        virtual void close() = 0;

        virtual bool is_closed() const = 0;

        // Executor every coroutine touching this session must run on.
        virtual asio::any_io_executor get_executor() = 0;

        /**
         * @brief Install the callback run when the session closes, whoever
         * closes it. Runs immediately if the session is already closed.
         */
        void set_close_handler(std::function<void()> handler) {
            if (closed_) {
                if (handler) handler();
                return;
            }
            close_handler_ = std::move(handler);
        }

        // A streaming session no longer accepts requests.
        void set_streaming(bool streaming) { is_streaming_ = streaming; }
        bool is_streaming() const { return is_streaming_; }

        const std::string &get_session_id() const { return session_id_; }

        void set_headers(const std::unordered_map<std::string, std::string> &headers) { headers_ = headers; }
        const std::unordered_map<std::string, std::string> &get_headers() const { return headers_; }

    protected:
        Session() = default;

        // Marks the session closed and fires the close handler (once).
        void mark_closed() {
            if (closed_) return;
            closed_ = true;
            is_streaming_ = false;
            auto handler = std::move(close_handler_);
            close_handler_ = nullptr;
            if (handler) handler();
        }

        std::string session_id_;                              ///< Unique session identifier
        std::unordered_map<std::string, std::string> headers_;///< HTTP headers of the last request
        bool is_streaming_ = false;
        bool closed_ = false;

    private:
        std::function<void()> close_handler_;
    };

}// namespace pushhub::transport
