#include "server.h"
#include "business/calculator_commands.h"
#include "core/logger.h"
#include <nlohmann/json.hpp>
#include <thread>

namespace pushhub::core {

    std::unique_ptr<HubServer> HubServer::Builder::build() {
        auto server = std::unique_ptr<HubServer>(new HubServer());
        server->shutdown_grace_ = options_.shutdown_grace;

        server->commands_ = commands_ ? commands_ : business::make_calculator_registry();
        server->registry_ = std::make_shared<hub::ConnectionRegistry>(options_.channel);
        server->broadcaster_ = std::make_shared<hub::Broadcaster>(server->registry_);
        server->notifier_ = std::make_shared<hub::DeferredNotifier>(
                server->io_context_.get_executor(), server->broadcaster_, server->commands_, options_.notifier);

        business::DispatchContext context;
        context.commands = server->commands_;
        context.broadcaster = server->broadcaster_;
        context.notifier = server->notifier_;
        context.server_name = server_name_;
        server->request_handler_ = std::make_unique<business::RequestHandler>(std::move(context));

        auto commands = server->commands_->list_commands();
        PUSHHUB_INFO("Commands available (total: {}):", commands.size());
        for (const auto &command: commands) {
            PUSHHUB_INFO("  - '{}'", command.name);
        }

        server->sse_stream_ = std::make_unique<transport::SseStream>(server->registry_, options_.stream);
        server->pool_ = std::make_unique<AsioIOServicePool>(io_threads_);
        server->http_transport_ = std::make_unique<transport::HttpTransport>(
                server->io_context_, *server->pool_, address_, port_);

        auto *raw = server.get();
        transport::Endpoints endpoints;
        endpoints.on_message = [raw](const std::string &body) {
            return raw->request_handler_->handle_message(body);
        };
        endpoints.on_stream = [raw](std::shared_ptr<transport::Session> session) {
            raw->sse_stream_->spawn(std::move(session));
        };
        endpoints.on_health = [raw]() { return raw->health(); };
        endpoints.on_debug = [raw]() { return raw->debug_tools(); };

        server->http_transport_->start(std::move(endpoints));
        PUSHHUB_INFO("Heartbeat interval {} ms, channel capacity {}",
                     options_.stream.heartbeat_interval.count(), options_.channel.capacity);
        return server;
    }

    HubServer::~HubServer() {
        if (http_transport_) {
            http_transport_->stop();
        }
        // sessions reference the transport's handler: stop them first
        if (pool_) {
            pool_->Stop();
        }
    }

    void HubServer::run() {
        auto work = asio::make_work_guard(io_context_);
        PUSHHUB_INFO("Server running on port {}", port());
        io_context_.run();
        wait_for_streams(shutdown_grace_);
        if (pool_) {
            pool_->Stop();
        }
        PUSHHUB_INFO("Server stopped");
    }

    void HubServer::stop() {
        asio::post(io_context_, [this]() {
            PUSHHUB_INFO("Stopping server");
            http_transport_->stop();
            broadcaster_->close_all();
            io_context_.stop();
        });
    }

    void HubServer::wait_for_streams(std::chrono::milliseconds grace) {
        // streams consume their close signal on the pool threads
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (registry_->size() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (auto left = registry_->size(); left > 0) {
            PUSHHUB_WARN("{} streams still open after {} ms, dropping them", left, grace.count());
        }
    }

    unsigned short HubServer::port() const {
        return http_transport_ ? http_transport_->port() : 0;
    }

    transport::HttpReply HubServer::health() const {
        nlohmann::json body = {
                {"status", "healthy"},
                {"connections", registry_->size()}};
        return {200, body.dump()};
    }

    transport::HttpReply HubServer::debug_tools() const {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto &command: commands_->list_commands()) {
            tools.push_back(protocol::to_json(command));
        }
        nlohmann::json connections = nlohmann::json::object();
        auto depths = registry_->queue_depths();
        for (const auto &[id, depth]: depths) {
            connections[std::to_string(id)] = depth;
        }
        nlohmann::json body = {
                {"tools", tools},
                {"connections", connections},
                {"connection_count", depths.size()}};
        return {200, body.dump()};
    }

}// namespace pushhub::core
