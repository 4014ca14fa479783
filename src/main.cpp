#include "config/config.hpp"// Configuration management using INI file
#include "config/config_observer.hpp"
#include "core/logger.h"
#include "core/server.h"
#include "hub/delivery_channel.h"
#include <asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <version.h>

namespace {

    // Applies the reloadable part of the configuration: the log level.
    class LogLevelObserver : public pushhub::config::ConfigObserver {
    public:
        void onConfigReloaded(const pushhub::config::GlobalConfig &newConfig) override {
            auto level = pushhub::core::parse_log_level(newConfig.server.log_level);
            if (level != pushhub::core::HubLogger::instance().get_level()) {
                pushhub::core::HubLogger::instance().set_level(level);
                PUSHHUB_INFO("Log level changed to {}", newConfig.server.log_level);
            }
        }
    };

    pushhub::core::HubOptions make_hub_options(const pushhub::config::GlobalConfig &config) {
        pushhub::core::HubOptions options;
        options.channel.capacity = config.hub.channel_capacity;
        options.channel.overflow_policy = pushhub::hub::parse_overflow_policy(config.hub.overflow_policy);
        options.stream.heartbeat_interval = std::chrono::milliseconds(config.hub.heartbeat_interval_ms);
        options.stream.send_connect_event = config.hub.send_connect_event;
        options.shutdown_grace = std::chrono::milliseconds(config.hub.shutdown_grace_ms);
        options.notifier.list_changed_delay = std::chrono::milliseconds(config.notifier.list_changed_delay_ms);
        options.notifier.direct_list_enabled = config.notifier.direct_list_enabled;
        options.notifier.direct_list_delay = std::chrono::milliseconds(config.notifier.direct_list_delay_ms);
        options.notifier.direct_list_followup = std::chrono::milliseconds(config.notifier.direct_list_followup_ms);
        options.notifier.direct_list_ids = pushhub::config::parse_id_list(config.notifier.direct_list_ids);
        return options;
    }

}// namespace

/**
 * Entry point of the push hub.
 * Loads the configuration (pushhub.ini or the file named by the first
 * argument), sets up logging, builds the server and runs it until SIGINT
 * or SIGTERM.
 *
 * @return 0 on clean shutdown, 1 if startup fails.
 */
int main(int argc, char *argv[]) {
    try {
        if (argc > 1) {
            pushhub::config::set_config_file_path(argv[1]);
        }

        // Step 1: Load the configuration, creating a default file if missing,
        // and watch it for changes.
        pushhub::config::initialize_config_system(pushhub::config::ConfigMode::DYNAMIC);
        auto config = pushhub::config::get_current_config();

        // Step 2: Initialize the asynchronous logger using settings from the config.
        pushhub::core::initializeAsyncLogger(
                config.server.log_path,
                config.server.log_level,
                config.server.max_file_size,
                config.server.max_files);
        PUSHHUB_INFO("Starting {} {} with configuration: {}", PROJECT_NAME, PROJECT_VERSION,
                     pushhub::config::get_config_file_path());
        pushhub::config::print_config(config);

        LogLevelObserver log_level_observer;
        pushhub::config::g_config_loader->addObserver(&log_level_observer);

        // Step 3: Build the server; this binds the listening socket.
        auto server = pushhub::core::HubServer::Builder{}
                              .with_address(config.server.ip)
                              .with_port(config.server.port)
                              .with_io_threads(config.server.io_threads)
                              .with_server_name(config.server.server_name)
                              .with_hub_options(make_hub_options(config))
                              .build();

        // Graceful shutdown on SIGINT/SIGTERM
        asio::signal_set signals(server->get_io_context(), SIGINT, SIGTERM);
        signals.async_wait([&server](const asio::error_code &error, int signal_number) {
            if (!error) {
                PUSHHUB_INFO("Received signal {}, initiating graceful shutdown...", signal_number);
                server->stop();
            }
        });

        PUSHHUB_INFO("Streams on GET /sse, JSON-RPC on POST /messages.");

        // Step 4: Blocks until stopped.
        server->run();

        pushhub::config::g_config_loader->removeObserver(&log_level_observer);
        pushhub::config::g_config_loader->stopMonitoring();
        PUSHHUB_INFO("Server shutdown complete.");
        pushhub::core::shutdownLogger();
        return 0;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        PUSHHUB_ERROR("Server error: {}", e.what());
        return 1;
    }
}
