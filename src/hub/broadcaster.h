// src/hub/broadcaster.h
#pragma once

#include "connection_registry.h"
#include "protocol/json_rpc.h"
#include <memory>
#include <string>

namespace pushhub::hub {

    struct BroadcastReport {
        size_t recipients = 0;///< connections in the snapshot
        size_t delivered = 0; ///< pushes accepted (including drop-oldest)
        size_t failed = 0;    ///< pushes refused or addressed to a vanished connection
    };

    /**
     * @brief Fans messages out to every registered connection.
     * Delivery is best effort per recipient; a failing recipient never stops
     * the others. Broadcasts are not retroactive: connections registered after
     * the snapshot do not receive the message.
     */
    class Broadcaster {
    public:
        explicit Broadcaster(std::shared_ptr<ConnectionRegistry> registry);

        BroadcastReport broadcast(const protocol::Message &message) const;

        // Same, for an already serialized payload.
        BroadcastReport broadcast_raw(const std::string &payload) const;

        // Queue the close sentinel on every registered connection.
        BroadcastReport close_all() const;

        std::shared_ptr<ConnectionRegistry> registry() const { return registry_; }

    private:
        std::shared_ptr<ConnectionRegistry> registry_;
    };

}// namespace pushhub::hub
