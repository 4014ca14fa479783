#include "tcp_session.h"
#include "core/logger.h"
#include "http_handler.h"
#include "utils/session_id.h"
#include <charconv>
#include <optional>
#include <string_view>

using asio::use_awaitable;

namespace pushhub::transport {

    namespace {
        // Content-Length of a header block, 0 when absent. nullopt if malformed.
        std::optional<size_t> content_length_of(std::string_view headers) {
            auto value = HttpHandler::get_header_value(std::string(headers), "Content-Length");
            if (value.empty()) {
                return size_t{0};
            }
            size_t length = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec != std::errc() || end != value.data() + value.size()) {
                return std::nullopt;
            }
            return length;
        }
    }// namespace

    TcpSession::TcpSession(asio::ip::tcp::socket socket)
        : socket_(std::move(socket)) {
        session_id_ = utils::generate_session_id();
    }

    /**
     * @brief Read HTTP requests off the socket and hand complete ones to the handler.
     * Runs until the peer disconnects or the session is closed.
     * @param handler HTTP handler for processing requests
     */
    asio::awaitable<void> TcpSession::start(HttpHandler *handler) {
        auto self = shared_from_this();
        try {
            std::string request_buffer;
            while (!is_closed()) {
                auto n = co_await socket_.async_read_some(asio::buffer(buffer_), use_awaitable);
                if (n == 0) break;

                // A streaming session only reads to notice the peer going away
                if (is_streaming()) {
                    continue;
                }

                request_buffer.append(buffer_.data(), n);
                if (request_buffer.size() > MAX_REQUEST_SIZE) {
                    PUSHHUB_WARN("Request too large on session {}, closing", session_id_);
                    break;
                }

                while (!request_buffer.empty() && !is_streaming()) {
                    size_t header_end = request_buffer.find("\r\n\r\n");
                    if (header_end == std::string::npos) {
                        break;// Incomplete headers - wait for more data
                    }

                    auto content_length = content_length_of(std::string_view(request_buffer).substr(0, header_end + 2));
                    if (!content_length) {
                        // Let the handler answer 400 for the header block alone
                        co_await handler->handle_request(self, request_buffer.substr(0, header_end + 4));
                        request_buffer.clear();
                        break;
                    }

                    size_t total_required = header_end + 4 + *content_length;
                    if (request_buffer.length() < total_required) {
                        break;// Incomplete body - wait for more data
                    }
                    std::string complete_request = request_buffer.substr(0, total_required);
                    request_buffer.erase(0, total_required);
                    co_await handler->handle_request(self, complete_request);
                }
            }
        } catch (const std::system_error &e) {
            if (!closed_ && e.code() != asio::error::eof) {
                PUSHHUB_WARN("TCP session {} read error: {}", session_id_, e.what());
            }
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("TCP session {} failed: {}", session_id_, e.what());
        }
        PUSHHUB_DEBUG("TCP session {} finished reading", session_id_);
        close();
        co_return;
    }

    /**
     * @brief Write data to the TCP socket.
     * @param message Data to send to client
     */
    asio::awaitable<void> TcpSession::write(const std::string &message) {
        if (is_closed()) {
            co_return;
        }
        try {
            co_await asio::async_write(socket_, asio::buffer(message), use_awaitable);
        } catch (const std::exception &e) {
            PUSHHUB_WARN("Failed to write to TCP session {}: {}", session_id_, e.what());
            close();
        }
        co_return;
    }

    /**
     * @brief Close the TCP session and release the socket.
     */
    void TcpSession::close() {
        if (closed_) {
            return;
        }
        if (socket_.is_open()) {
            asio::error_code ec;
            socket_.cancel(ec);
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
        mark_closed();
    }

    bool TcpSession::is_closed() const {
        return closed_ || !socket_.is_open();
    }

}// namespace pushhub::transport
