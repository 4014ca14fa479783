#include "deferred_notifier.h"
#include "core/logger.h"
#include <stdexcept>

namespace pushhub::hub {

    namespace {
        asio::awaitable<void> sleep_for(std::chrono::milliseconds delay) {
            asio::steady_timer timer(co_await asio::this_coro::executor, delay);
            co_await timer.async_wait(asio::use_awaitable);
        }
    }// namespace

    DeferredNotifier::DeferredNotifier(asio::any_io_executor executor,
                                       std::shared_ptr<Broadcaster> broadcaster,
                                       std::shared_ptr<business::CommandHandler> commands,
                                       NotifierOptions options)
        : executor_(std::move(executor)),
          broadcaster_(std::move(broadcaster)),
          commands_(std::move(commands)),
          options_(std::move(options)) {
        if (!broadcaster_) {
            throw std::invalid_argument("Broadcaster cannot be null");
        }
        if (!commands_) {
            throw std::invalid_argument("CommandHandler cannot be null");
        }
    }

    void DeferredNotifier::schedule_list_changed() {
        PUSHHUB_DEBUG("Scheduling tools/list_changed in {} ms", options_.list_changed_delay.count());
        asio::co_spawn(
                executor_,
                [self = shared_from_this()]() -> asio::awaitable<void> {
                    co_await self->run_list_changed();
                },
                asio::detached);
    }

    bool DeferredNotifier::schedule_direct_list() {
        if (!options_.direct_list_enabled) {
            PUSHHUB_DEBUG("Direct tools list push disabled, not scheduling");
            return false;
        }
        PUSHHUB_DEBUG("Scheduling direct tools list push in {} ms", options_.direct_list_delay.count());
        asio::co_spawn(
                executor_,
                [self = shared_from_this()]() -> asio::awaitable<void> {
                    co_await self->run_direct_list();
                },
                asio::detached);
        return true;
    }

    asio::awaitable<size_t> DeferredNotifier::run_list_changed() {
        size_t delivered = 0;
        try {
            co_await sleep_for(options_.list_changed_delay);
            PUSHHUB_INFO("Sending tools notification after initialization");
            delivered = broadcaster_->broadcast(protocol::make_notification(TOOLS_LIST_CHANGED)).delivered;
            PUSHHUB_INFO("Tool list being broadcasted: {} tools available", commands_->list_commands().size());
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("tools/list_changed task failed: {}", e.what());
        }
        co_return delivered;
    }

    asio::awaitable<size_t> DeferredNotifier::run_direct_list() {
        size_t delivered = 0;
        try {
            co_await sleep_for(options_.direct_list_delay);
            delivered += broadcaster_->broadcast(protocol::make_notification(TOOLS_LIST_CHANGED)).delivered;

            co_await sleep_for(options_.direct_list_followup);
            for (const auto &id: options_.direct_list_ids) {
                delivered += broadcaster_->broadcast(make_tools_list_response(id)).delivered;
            }
            PUSHHUB_INFO("Direct tools list push finished ({} deliveries)", delivered);
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("Direct tools list task failed: {}", e.what());
        }
        co_return delivered;
    }

    protocol::Message DeferredNotifier::make_tools_list_response(const nlohmann::json &id) const {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto &command: commands_->list_commands()) {
            tools.push_back(protocol::to_json(command));
        }
        return protocol::Response::success(id, nlohmann::json{{"tools", tools}});
    }

}// namespace pushhub::hub
