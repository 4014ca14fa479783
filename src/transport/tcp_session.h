#pragma once

#include "session.h"
#include <array>

namespace pushhub::transport {

    /**
     * @brief Plain TCP session carrying HTTP/1.1 requests.
     */
    class TcpSession : public Session {
    public:
        explicit TcpSession(asio::ip::tcp::socket socket);
        ~TcpSession() override = default;

        asio::awaitable<void> start(HttpHandler *handler) override;
        asio::awaitable<void> write(const std::string &message) override;

        void close() override;
        bool is_closed() const override;
        asio::any_io_executor get_executor() override { return socket_.get_executor(); }

        // Largest request (headers and body) a session buffers before giving up.
        static constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;

    private:
        asio::ip::tcp::socket socket_;///< Underlying TCP socket
        std::array<char, 8192> buffer_;///< Buffer for reading data
    };

}// namespace pushhub::transport
