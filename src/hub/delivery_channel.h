// src/hub/delivery_channel.h
#pragma once

#include <asio.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pushhub::hub {

    /**
     * @brief What a full channel does with a new message.
     */
    enum class OverflowPolicy {
        REJECT_NEW, ///< keep the queue, refuse the new message
        DROP_OLDEST ///< evict the oldest queued message to make room
    };

    enum class PushOutcome {
        ACCEPTED,
        DROPPED_OLDEST, ///< accepted, an older message was evicted
        REJECTED_FULL,
        REJECTED_CLOSED,///< close sentinel queued or consumer gone
        NOT_REGISTERED  ///< no such connection (registry level only)
    };

    enum class PullStatus {
        MESSAGE,
        TIMED_OUT,
        CLOSED
    };

    struct PullResult {
        PullStatus status = PullStatus::TIMED_OUT;
        std::string payload;
    };

    struct ChannelOptions {
        size_t capacity = 256;
        OverflowPolicy overflow_policy = OverflowPolicy::DROP_OLDEST;
    };

    const char *to_string(PushOutcome outcome);
    OverflowPolicy parse_overflow_policy(const std::string &name);

    /**
     * @brief Ordered, bounded hand-off from any number of producers to one
     * consuming stream.
     *
     * push() and push_close() are thread-safe and never block. pull() must be
     * awaited from a coroutine running on the executor the channel was
     * created with; wake-ups are posted to that executor, which must not
     * run handlers concurrently (one thread per io_context, or a strand).
     */
    class DeliveryChannel : public std::enable_shared_from_this<DeliveryChannel> {
    public:
        DeliveryChannel(asio::any_io_executor executor, ChannelOptions options);

        PushOutcome push(std::string message);

        /**
         * @brief Queue the close sentinel behind every pending message.
         * Ignores capacity. Later pushes are rejected.
         * @return false if the channel was already closing.
         */
        bool push_close();

        /**
         * @brief The consumer's transport is gone: drop pending messages and
         * make the current or next pull() return CLOSED.
         */
        void cancel();

        /**
         * @brief Wait until a message or the close sentinel is available, or
         * until timeout elapses.
         */
        asio::awaitable<PullResult> pull(std::chrono::milliseconds timeout);

        // Number of queued messages, close sentinel excluded.
        size_t depth() const;
        bool is_closing() const;

    private:
        void notify_consumer();

        mutable std::mutex mutex_;
        std::deque<std::optional<std::string>> queue_;// nullopt is the close sentinel
        size_t pending_messages_ = 0;
        ChannelOptions options_;
        bool close_queued_ = false;
        bool cancelled_ = false;
        asio::steady_timer signal_;
    };

}// namespace pushhub::hub
