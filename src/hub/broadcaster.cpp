#include "broadcaster.h"
#include "core/logger.h"
#include <stdexcept>

namespace pushhub::hub {

    namespace {
        bool delivered(PushOutcome outcome) {
            return outcome == PushOutcome::ACCEPTED || outcome == PushOutcome::DROPPED_OLDEST;
        }
    }// namespace

    Broadcaster::Broadcaster(std::shared_ptr<ConnectionRegistry> registry)
        : registry_(std::move(registry)) {
        if (!registry_) {
            throw std::invalid_argument("ConnectionRegistry cannot be null");
        }
    }

    BroadcastReport Broadcaster::broadcast(const protocol::Message &message) const {
        return broadcast_raw(protocol::encode(message));
    }

    BroadcastReport Broadcaster::broadcast_raw(const std::string &payload) const {
        BroadcastReport report;
        auto recipients = registry_->snapshot();
        report.recipients = recipients.size();

        PUSHHUB_INFO("Broadcasting to {} connection(s): {}", recipients.size(), payload);
        if (recipients.empty()) {
            PUSHHUB_WARN("No active connections to broadcast to");
            return report;
        }

        for (auto id: recipients) {
            auto outcome = registry_->push(id, payload);
            if (delivered(outcome)) {
                ++report.delivered;
                if (outcome == PushOutcome::DROPPED_OLDEST) {
                    PUSHHUB_WARN("Connection {} queue full, dropped its oldest message", id);
                } else {
                    PUSHHUB_DEBUG("Queued message for connection {}", id);
                }
            } else {
                ++report.failed;
                PUSHHUB_ERROR("Failed to deliver to connection {}: {}", id, to_string(outcome));
            }
        }
        return report;
    }

    BroadcastReport Broadcaster::close_all() const {
        BroadcastReport report;
        auto recipients = registry_->snapshot();
        report.recipients = recipients.size();

        for (auto id: recipients) {
            auto outcome = registry_->push_close(id);
            if (outcome == PushOutcome::ACCEPTED) {
                ++report.delivered;
                PUSHHUB_INFO("Sent close signal to connection {}", id);
            } else {
                ++report.failed;
                PUSHHUB_DEBUG("Close signal for connection {} not queued: {}", id, to_string(outcome));
            }
        }
        return report;
    }

}// namespace pushhub::hub
