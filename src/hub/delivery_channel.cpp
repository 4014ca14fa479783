#include "delivery_channel.h"
#include "core/logger.h"

namespace pushhub::hub {

    const char *to_string(PushOutcome outcome) {
        switch (outcome) {
            case PushOutcome::ACCEPTED:
                return "accepted";
            case PushOutcome::DROPPED_OLDEST:
                return "dropped-oldest";
            case PushOutcome::REJECTED_FULL:
                return "rejected-full";
            case PushOutcome::REJECTED_CLOSED:
                return "rejected-closed";
            case PushOutcome::NOT_REGISTERED:
                return "not-registered";
        }
        return "unknown";
    }

    OverflowPolicy parse_overflow_policy(const std::string &name) {
        if (name == "reject" || name == "reject_new") {
            return OverflowPolicy::REJECT_NEW;
        }
        if (name != "drop_oldest") {
            PUSHHUB_WARN("Unknown overflow policy '{}', using drop_oldest", name);
        }
        return OverflowPolicy::DROP_OLDEST;
    }

    DeliveryChannel::DeliveryChannel(asio::any_io_executor executor, ChannelOptions options)
        : options_(options),
          signal_(std::move(executor)) {
        if (options_.capacity == 0) {
            options_.capacity = 1;
        }
    }

    PushOutcome DeliveryChannel::push(std::string message) {
        PushOutcome outcome = PushOutcome::ACCEPTED;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_queued_ || cancelled_) {
                return PushOutcome::REJECTED_CLOSED;
            }
            if (pending_messages_ >= options_.capacity) {
                if (options_.overflow_policy == OverflowPolicy::REJECT_NEW) {
                    return PushOutcome::REJECTED_FULL;
                }
                // no sentinel can be queued here, so the front is a message
                queue_.pop_front();
                --pending_messages_;
                outcome = PushOutcome::DROPPED_OLDEST;
            }
            queue_.emplace_back(std::move(message));
            ++pending_messages_;
        }
        notify_consumer();
        return outcome;
    }

    bool DeliveryChannel::push_close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_queued_ || cancelled_) {
                return false;
            }
            close_queued_ = true;
            queue_.emplace_back(std::nullopt);
        }
        notify_consumer();
        return true;
    }

    void DeliveryChannel::cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return;
            }
            cancelled_ = true;
            queue_.clear();
            pending_messages_ = 0;
        }
        notify_consumer();
    }

    void DeliveryChannel::notify_consumer() {
        // steady_timer is not thread-safe: cancel on the consumer's executor.
        // A stale wake-up only makes pull() re-check the queue.
        asio::post(signal_.get_executor(), [self = shared_from_this()]() {
            self->signal_.cancel();
        });
    }

    asio::awaitable<PullResult> DeliveryChannel::pull(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (cancelled_) {
                    co_return PullResult{PullStatus::CLOSED, {}};
                }
                if (!queue_.empty()) {
                    auto front = std::move(queue_.front());
                    queue_.pop_front();
                    if (!front.has_value()) {
                        co_return PullResult{PullStatus::CLOSED, {}};
                    }
                    --pending_messages_;
                    co_return PullResult{PullStatus::MESSAGE, std::move(*front)};
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    co_return PullResult{PullStatus::TIMED_OUT, {}};
                }
            }

            signal_.expires_at(deadline);
            asio::error_code ec;
            co_await signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            // operation_aborted means a producer woke us; either way re-check
        }
    }

    size_t DeliveryChannel::depth() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_messages_;
    }

    bool DeliveryChannel::is_closing() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_queued_ || cancelled_;
    }

}// namespace pushhub::hub
