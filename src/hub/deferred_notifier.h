// src/hub/deferred_notifier.h
#pragma once

#include "broadcaster.h"
#include "business/command_handler.h"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

namespace pushhub::hub {

    constexpr const char *TOOLS_LIST_CHANGED = "notifications/tools/list_changed";

    struct NotifierOptions {
        std::chrono::milliseconds list_changed_delay{500};

        // The direct-list sequence pushes full tools/list responses nobody asked
        // for, for clients that never send tools/list themselves. It is a
        // compatibility workaround; the ids carry no protocol meaning.
        bool direct_list_enabled = true;
        std::chrono::milliseconds direct_list_delay{1000};
        std::chrono::milliseconds direct_list_followup{500};
        std::vector<nlohmann::json> direct_list_ids{"tools-list-push", 1};
    };

    /**
     * @brief Fire-once delayed broadcasts triggered by the initialization handshake.
     *
     * Scheduled tasks are not tracked and cannot be cancelled: each one runs to
     * completion on the notifier's executor, even when every connection has gone
     * by then (the broadcast is then a no-op). Failures are logged, never retried.
     */
    class DeferredNotifier : public std::enable_shared_from_this<DeferredNotifier> {
    public:
        DeferredNotifier(asio::any_io_executor executor,
                         std::shared_ptr<Broadcaster> broadcaster,
                         std::shared_ptr<business::CommandHandler> commands,
                         NotifierOptions options = {});

        // After list_changed_delay, broadcast one tools/list_changed notification.
        void schedule_list_changed();

        /**
         * @brief After direct_list_delay broadcast tools/list_changed, then after
         * direct_list_followup broadcast one tools/list response per configured id.
         * @return false if the sequence is disabled by configuration
         */
        bool schedule_direct_list();

        // Coroutine bodies of the two sequences; return the number of accepted pushes.
        asio::awaitable<size_t> run_list_changed();
        asio::awaitable<size_t> run_direct_list();

        const NotifierOptions &options() const { return options_; }

    private:
        protocol::Message make_tools_list_response(const nlohmann::json &id) const;

        asio::any_io_executor executor_;
        std::shared_ptr<Broadcaster> broadcaster_;
        std::shared_ptr<business::CommandHandler> commands_;
        NotifierOptions options_;
    };

}// namespace pushhub::hub
