// src/core/server.h
#pragma once

#include "business/command_handler.h"
#include "business/request_handler.h"
#include "core/io_context_pool.hpp"
#include "hub/broadcaster.h"
#include "hub/connection_registry.h"
#include "hub/deferred_notifier.h"
#include "transport/http_transport.h"
#include "transport/sse_stream.h"
#include <asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace pushhub::core {

    struct HubOptions {
        hub::ChannelOptions channel;
        transport::StreamOptions stream;
        hub::NotifierOptions notifier;
        // How long run() lets open streams finish after stop()
        std::chrono::milliseconds shutdown_grace{1000};
    };

    /**
     * @brief The push hub: HTTP endpoints, live SSE connections and the
     * deferred handshake notifications, wired together.
     *
     * The acceptor and the deferred notifier run on the server's own
     * io_context (the thread calling run()); sessions and their streams run
     * on the io_context pool.
     */
    class HubServer {
    public:
        class Builder;

        ~HubServer();

        // Blocks until stop() is called and the open streams closed.
        void run();

        // Thread-safe; may be called from a signal handler's completion.
        // Stops accepting and sends every stream its close signal.
        void stop();

        asio::io_context &get_io_context() { return io_context_; }
        unsigned short port() const;

        std::shared_ptr<hub::ConnectionRegistry> registry() const { return registry_; }
        std::shared_ptr<hub::Broadcaster> broadcaster() const { return broadcaster_; }
        business::RequestHandler &request_handler() { return *request_handler_; }

        transport::HttpReply health() const;
        transport::HttpReply debug_tools() const;

    private:
        HubServer() = default;
        friend class Builder;

        // Wait until every stream has unregistered, at most grace.
        void wait_for_streams(std::chrono::milliseconds grace);

        asio::io_context io_context_;
        std::chrono::milliseconds shutdown_grace_{1000};
        std::unique_ptr<AsioIOServicePool> pool_;
        std::shared_ptr<business::CommandHandler> commands_;
        std::shared_ptr<hub::ConnectionRegistry> registry_;
        std::shared_ptr<hub::Broadcaster> broadcaster_;
        std::shared_ptr<hub::DeferredNotifier> notifier_;
        std::unique_ptr<business::RequestHandler> request_handler_;
        std::unique_ptr<transport::SseStream> sse_stream_;
        std::unique_ptr<transport::HttpTransport> http_transport_;
    };

    class HubServer::Builder {
    public:
        Builder &with_address(const std::string &address = "0.0.0.0") {
            address_ = address;
            return *this;
        }
        Builder &with_port(unsigned short port = 8000) {
            port_ = port;
            return *this;
        }
        Builder &with_io_threads(std::size_t threads) {
            io_threads_ = threads;
            return *this;
        }
        Builder &with_server_name(const std::string &name) {
            server_name_ = name;
            return *this;
        }
        Builder &with_hub_options(const HubOptions &options) {
            options_ = options;
            return *this;
        }
        // Defaults to the calculator command set.
        Builder &with_command_handler(std::shared_ptr<business::CommandHandler> commands) {
            commands_ = std::move(commands);
            return *this;
        }

        /**
         * @brief Create every component and start listening.
         * @throws std::system_error if the address cannot be bound
         */
        std::unique_ptr<HubServer> build();

    private:
        std::string address_ = "0.0.0.0";
        unsigned short port_ = 8000;
        std::size_t io_threads_ = 2;
        std::string server_name_ = "calculator-server";
        HubOptions options_;
        std::shared_ptr<business::CommandHandler> commands_;
    };

}// namespace pushhub::core
