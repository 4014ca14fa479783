#include "http_transport.h"
#include "core/io_context_pool.hpp"
#include "core/logger.h"
#include "tcp_session.h"

using asio::use_awaitable;

namespace pushhub::transport {

    /**
     * @brief Bind the listening socket.
     * @throws std::system_error if the address cannot be bound
     */
    HttpTransport::HttpTransport(asio::io_context &io_context, core::AsioIOServicePool &pool,
                                 const std::string &address, unsigned short port)
        : io_context_(io_context),
          pool_(pool),
          acceptor_(io_context, asio::ip::tcp::endpoint(asio::ip::make_address(address), port)) {
        PUSHHUB_INFO("HTTP Transport initialized on {}:{}", address, acceptor_.local_endpoint().port());
    }

    HttpTransport::~HttpTransport() {
        stop();
    }

    bool HttpTransport::start(Endpoints endpoints) {
        handler_ = std::make_unique<HttpHandler>(std::move(endpoints));
        is_running_ = true;
        PUSHHUB_INFO("HTTP Transport listening on {}:{}",
                     acceptor_.local_endpoint().address().to_string(),
                     acceptor_.local_endpoint().port());
        asio::co_spawn(io_context_, do_accept(), asio::detached);
        return true;
    }

    asio::awaitable<void> HttpTransport::do_accept() {
        while (is_running_) {
            auto &session_io_context = pool_.GetIOService();
            asio::error_code ec;
            // Accept straight onto the session's context
            auto socket = co_await acceptor_.async_accept(session_io_context, asio::redirect_error(use_awaitable, ec));
            if (ec) {
                if (ec == asio::error::operation_aborted || !is_running_) {
                    break;
                }
                PUSHHUB_WARN("Error accepting HTTP connection: {}", ec.message());
                continue;
            }

            asio::error_code ep_ec;
            auto remote = socket.remote_endpoint(ep_ec);
            if (!ep_ec) {
                PUSHHUB_DEBUG("HTTP client connected from {}:{}", remote.address().to_string(), remote.port());
            }

            auto session = std::make_shared<TcpSession>(std::move(socket));
            asio::co_spawn(session_io_context,
                           [session, handler = handler_.get()]() -> asio::awaitable<void> {
                               co_await session->start(handler);
                           },
                           asio::detached);
        }
        PUSHHUB_INFO("HTTP acceptor stopped");
    }

    void HttpTransport::stop() {
        if (!is_running_.exchange(false)) {
            return;
        }
        asio::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short HttpTransport::port() const {
        asio::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

}// namespace pushhub::transport
