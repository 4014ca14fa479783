#include "sse_stream.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <stdexcept>

namespace pushhub::transport {

    SseStream::SseStream(std::shared_ptr<hub::ConnectionRegistry> registry, StreamOptions options)
        : registry_(std::move(registry)), options_(options) {
        if (!registry_) {
            throw std::invalid_argument("ConnectionRegistry cannot be null");
        }
        if (options_.heartbeat_interval < MIN_HEARTBEAT_INTERVAL) {
            PUSHHUB_WARN("Heartbeat interval {} ms too small, using {} ms",
                         options_.heartbeat_interval.count(), MIN_HEARTBEAT_INTERVAL.count());
            options_.heartbeat_interval = MIN_HEARTBEAT_INTERVAL;
        }
    }

    std::string SseStream::response_head() {
        return "HTTP/1.1 200 OK\r\n"
               "Content-Type: text/event-stream\r\n"
               "Cache-Control: no-cache\r\n"
               "Connection: keep-alive\r\n"
               "X-Accel-Buffering: no\r\n"
               "Access-Control-Allow-Origin: *\r\n"
               "\r\n";
    }

    std::string SseStream::data_frame(const std::string &payload) {
        return "data: " + payload + "\n\n";
    }

    void SseStream::spawn(std::shared_ptr<Session> session) {
        auto executor = session->get_executor();
        asio::co_spawn(
                executor,
                [this, session = std::move(session)]() -> asio::awaitable<void> {
                    co_await run(session);
                },
                asio::detached);
    }

    asio::awaitable<hub::ConnectionId> SseStream::run(std::shared_ptr<Session> session) {
        session->set_streaming(true);
        auto id = registry_->register_connection(session->get_executor());
        auto channel = registry_->find(id);
        auto state = StreamState::STREAMING;

        // A disconnect seen by the session's read loop wakes the pending pull
        std::weak_ptr<hub::DeliveryChannel> weak_channel = channel;
        session->set_close_handler([weak_channel] {
            if (auto c = weak_channel.lock()) {
                c->cancel();
            }
        });

        try {
            co_await session->write(response_head());
            co_await session->write(KEEP_ALIVE);
            if (options_.send_connect_event && !session->is_closed()) {
                auto event = protocol::make_notification("notifications/debug",
                                                         {{"message", "SSE Connection Established"}});
                co_await session->write(data_frame(protocol::encode(event)));
            }
            PUSHHUB_INFO("SSE stream opened for connection {} (Session: {})", id, session->get_session_id());

            while (state == StreamState::STREAMING) {
                if (session->is_closed()) {
                    state = StreamState::CLOSED;
                    break;
                }
                auto result = co_await channel->pull(options_.heartbeat_interval);
                switch (result.status) {
                    case hub::PullStatus::MESSAGE:
                        PUSHHUB_DEBUG("Sending to connection {}: {}", id, result.payload);
                        co_await session->write(data_frame(result.payload));
                        break;
                    case hub::PullStatus::TIMED_OUT:
                        PUSHHUB_DEBUG("Heartbeat for connection {}", id);
                        co_await session->write(KEEP_ALIVE);
                        break;
                    case hub::PullStatus::CLOSED:
                        PUSHHUB_INFO("Close signal received for connection {}", id);
                        state = StreamState::CLOSED;
                        break;
                }
            }
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("SSE stream for connection {} failed: {}", id, e.what());
        }

        registry_->unregister_connection(id);
        session->set_close_handler(nullptr);
        session->close();
        PUSHHUB_INFO("SSE stream closed for connection {}", id);
        co_return id;
    }

}// namespace pushhub::transport
