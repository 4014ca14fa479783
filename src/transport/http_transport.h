#pragma once

#include "http_handler.h"
#include "transport_types.h"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace pushhub::core {
    class AsioIOServicePool;
}// namespace pushhub::core

namespace pushhub::transport {

    /**
     * @brief HTTP transport over plain TCP sockets.
     * Accepts on the given io_context and hands each connection to a session
     * running on the next io_context of the pool.
     */
    class HttpTransport {
    public:
        HttpTransport(asio::io_context &io_context, core::AsioIOServicePool &pool,
                      const std::string &address, unsigned short port);
        ~HttpTransport();

        /**
         * @brief Start accepting connections.
         * @param endpoints Application endpoints requests are routed to
         * @return True if startup successful
         */
        bool start(Endpoints endpoints);

        /**
         * @brief Stop accepting connections. Open sessions are left to the pool.
         */
        void stop();

        // Bound port; differs from the configured one when that was 0.
        unsigned short port() const;

    private:
        asio::awaitable<void> do_accept();

        asio::io_context &io_context_;
        core::AsioIOServicePool &pool_;
        asio::ip::tcp::acceptor acceptor_;
        std::unique_ptr<HttpHandler> handler_;
        std::atomic<bool> is_running_{false};
    };

}// namespace pushhub::transport
