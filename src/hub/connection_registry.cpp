#include "connection_registry.h"
#include "core/logger.h"

namespace pushhub::hub {

    ConnectionRegistry::ConnectionRegistry(ChannelOptions options)
        : options_(options) {
    }

    ConnectionId ConnectionRegistry::register_connection(asio::any_io_executor executor) {
        auto channel = std::make_shared<DeliveryChannel>(std::move(executor), options_);
        ConnectionId id;
        size_t live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            connections_.emplace(id, std::move(channel));
            live = connections_.size();
        }
        PUSHHUB_INFO("Registered connection {} (active connections: {})", id, live);
        return id;
    }

    bool ConnectionRegistry::unregister_connection(ConnectionId id) {
        size_t live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connections_.erase(id) == 0) {
                return false;
            }
            live = connections_.size();
        }
        PUSHHUB_INFO("Removed connection {} (active connections: {})", id, live);
        return true;
    }

    std::vector<ConnectionId> ConnectionRegistry::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConnectionId> ids;
        ids.reserve(connections_.size());
        for (const auto &[id, _]: connections_) {
            ids.push_back(id);
        }
        return ids;
    }

    std::shared_ptr<DeliveryChannel> ConnectionRegistry::find(ConnectionId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        return it != connections_.end() ? it->second : nullptr;
    }

    PushOutcome ConnectionRegistry::push(ConnectionId id, std::string message) const {
        // channel locks are independent of the registry lock
        auto channel = find(id);
        if (!channel) {
            return PushOutcome::NOT_REGISTERED;
        }
        return channel->push(std::move(message));
    }

    PushOutcome ConnectionRegistry::push_close(ConnectionId id) const {
        auto channel = find(id);
        if (!channel) {
            return PushOutcome::NOT_REGISTERED;
        }
        return channel->push_close() ? PushOutcome::ACCEPTED : PushOutcome::REJECTED_CLOSED;
    }

    std::map<ConnectionId, size_t> ConnectionRegistry::queue_depths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<ConnectionId, size_t> depths;
        for (const auto &[id, channel]: connections_) {
            depths.emplace(id, channel->depth());
        }
        return depths;
    }

    size_t ConnectionRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

}// namespace pushhub::hub
