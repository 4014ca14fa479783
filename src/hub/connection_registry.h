// src/hub/connection_registry.h
#pragma once

#include "delivery_channel.h"
#include <asio.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace pushhub::hub {

    using ConnectionId = std::uint64_t;

    /**
     * @brief Owns the live push connections and their delivery channels.
     *
     * All methods are thread-safe. Identities increase monotonically and are
     * never reused; once removed, an identity never comes back and pushes
     * addressed to it report NOT_REGISTERED.
     */
    class ConnectionRegistry {
    public:
        explicit ConnectionRegistry(ChannelOptions options = {});

        /**
         * @brief Allocate the next identity and an empty channel bound to executor.
         * @param executor Executor of the coroutine that will consume the channel
         */
        ConnectionId register_connection(asio::any_io_executor executor);

        /**
         * @brief Remove a connection. No-op if it is not registered.
         * @return true if an entry was removed
         */
        bool unregister_connection(ConnectionId id);

        // Registered identities, ascending.
        std::vector<ConnectionId> snapshot() const;

        // Channel of a registered connection, nullptr otherwise.
        std::shared_ptr<DeliveryChannel> find(ConnectionId id) const;

        PushOutcome push(ConnectionId id, std::string message) const;
        PushOutcome push_close(ConnectionId id) const;

        // Queued message count per registered connection.
        std::map<ConnectionId, size_t> queue_depths() const;

        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<ConnectionId, std::shared_ptr<DeliveryChannel>> connections_;
        ConnectionId next_id_ = 0;
        ChannelOptions options_;
    };

}// namespace pushhub::hub
