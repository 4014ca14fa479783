#ifndef PUSHHUB_CONFIG_HPP
#define PUSHHUB_CONFIG_HPP

#include "config_observer.hpp"
#include "core/logger.h"
#include "inicpp.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>


namespace pushhub {
    namespace config {

        constexpr const char *CONFIG_FILE = "pushhub.ini";

        inline std::string g_config_file_path;

        // Working-directory pushhub.ini unless set_config_file_path() chose another file.
        inline std::string get_config_file_path() {
            if (!g_config_file_path.empty()) {
                return g_config_file_path;
            }
            return CONFIG_FILE;
        }

        inline void set_config_file_path(const std::string &path) {
            g_config_file_path = path;
        }

        enum class ConfigMode {
            NONE,  // Use default settings without file
            STATIC,// Load from static file once
            DYNAMIC// Load and monitor for changes
        };

        /**
         * @brief Parse a comma separated id list. Tokens made of digits become
         * JSON integers, everything else a JSON string.
         */
        inline std::vector<nlohmann::json> parse_id_list(const std::string &text) {
            std::vector<nlohmann::json> ids;
            size_t start = 0;
            while (start <= text.size()) {
                size_t comma = text.find(',', start);
                std::string token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
                token.erase(0, token.find_first_not_of(" \t"));
                token.erase(token.find_last_not_of(" \t") + 1);
                if (!token.empty()) {
                    bool numeric = token.size() < 19 &&
                                   std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
                    if (numeric) {
                        ids.emplace_back(std::stoll(token));
                    } else {
                        ids.emplace_back(token);
                    }
                }
                if (comma == std::string::npos) {
                    break;
                }
                start = comma + 1;
            }
            return ids;
        }

        /**
 * Server-specific configuration structure
 */
        struct ServerConfig {
            std::string ip = "0.0.0.0";
            std::string server_name = "calculator-server";
            std::string log_level = "info";
            std::string log_path = "logs/pushhub.log";
            size_t max_file_size = 5242880;
            size_t max_files = 3;
            unsigned short port = 8000;
            size_t io_threads = 2;

            static ServerConfig load(inicpp::IniManager &ini) {
                try {
                    auto server_section = ini["server"];
                    ServerConfig config;

                    if (!server_section["ip"].String().empty()) config.ip = server_section["ip"].String();
                    if (!server_section["server_name"].String().empty()) config.server_name = server_section["server_name"].String();
                    if (!server_section["log_level"].String().empty()) config.log_level = server_section["log_level"].String();
                    if (!server_section["log_path"].String().empty()) config.log_path = server_section["log_path"].String();

                    if (!server_section["max_file_size"].String().empty()) config.max_file_size = static_cast<size_t>(server_section["max_file_size"]);
                    if (!server_section["max_files"].String().empty()) config.max_files = static_cast<size_t>(server_section["max_files"]);
                    if (!server_section["port"].String().empty()) config.port = static_cast<unsigned short>(server_section["port"]);
                    if (!server_section["io_threads"].String().empty()) config.io_threads = static_cast<size_t>(server_section["io_threads"]);

                    return config;
                } catch (const std::exception &e) {
                    PUSHHUB_ERROR("Failed to load server config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Connection hub configuration
 */
        struct HubConfig {
            static constexpr size_t MIN_HEARTBEAT_INTERVAL_MS = 1000;

            size_t heartbeat_interval_ms = 25000;
            size_t channel_capacity = 256;
            std::string overflow_policy = "drop_oldest";
            bool send_connect_event = true;
            size_t shutdown_grace_ms = 1000;

            static HubConfig load(inicpp::IniManager &ini) {
                try {
                    HubConfig config;
                    auto section = ini["hub"];
                    if (!section["heartbeat_interval_ms"].String().empty()) config.heartbeat_interval_ms = static_cast<size_t>(section["heartbeat_interval_ms"]);
                    if (!section["channel_capacity"].String().empty()) config.channel_capacity = static_cast<size_t>(section["channel_capacity"]);
                    if (!section["overflow_policy"].String().empty()) config.overflow_policy = section["overflow_policy"].String();
                    if (!section["send_connect_event"].String().empty()) config.send_connect_event = static_cast<bool>(section["send_connect_event"]);
                    if (!section["shutdown_grace_ms"].String().empty()) config.shutdown_grace_ms = static_cast<size_t>(section["shutdown_grace_ms"]);
                    if (config.heartbeat_interval_ms < MIN_HEARTBEAT_INTERVAL_MS) {
                        PUSHHUB_WARN("heartbeat_interval_ms {} too small, using {}", config.heartbeat_interval_ms, MIN_HEARTBEAT_INTERVAL_MS);
                        config.heartbeat_interval_ms = MIN_HEARTBEAT_INTERVAL_MS;
                    }
                    return config;
                } catch (const std::exception &e) {
                    PUSHHUB_ERROR("Failed to load hub config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Deferred notification configuration
 */
        struct NotifierConfig {
            size_t list_changed_delay_ms = 500;
            bool direct_list_enabled = true;
            size_t direct_list_delay_ms = 1000;
            size_t direct_list_followup_ms = 500;
            std::string direct_list_ids = "tools-list-push,1";

            static NotifierConfig load(inicpp::IniManager &ini) {
                try {
                    NotifierConfig config;
                    auto section = ini["notifier"];
                    if (!section["list_changed_delay_ms"].String().empty()) config.list_changed_delay_ms = static_cast<size_t>(section["list_changed_delay_ms"]);
                    if (!section["direct_list_enabled"].String().empty()) config.direct_list_enabled = static_cast<bool>(section["direct_list_enabled"]);
                    if (!section["direct_list_delay_ms"].String().empty()) config.direct_list_delay_ms = static_cast<size_t>(section["direct_list_delay_ms"]);
                    if (!section["direct_list_followup_ms"].String().empty()) config.direct_list_followup_ms = static_cast<size_t>(section["direct_list_followup_ms"]);
                    if (!section["direct_list_ids"].String().empty()) config.direct_list_ids = section["direct_list_ids"].String();
                    return config;
                } catch (const std::exception &e) {
                    PUSHHUB_ERROR("Failed to load notifier config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Global configuration
 */
        struct GlobalConfig {
            std::string title = "pushhub configuration";
            ServerConfig server;
            HubConfig hub;
            NotifierConfig notifier;

            static GlobalConfig load(const std::string &path = get_config_file_path()) {
                try {
                    inicpp::IniManager ini(path);
                    PUSHHUB_INFO("Loading configuration from: {}", path);

                    GlobalConfig config;
                    if (!ini[""]["title"].String().empty()) config.title = ini[""]["title"].String();
                    config.server = ServerConfig::load(ini);
                    config.hub = HubConfig::load(ini);
                    config.notifier = NotifierConfig::load(ini);
                    return config;
                } catch (const std::exception &e) {
                    PUSHHUB_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }
        };

        // Forward declaration
        class ConfigLoader;

        // Global state (managed by loader)
        inline std::unique_ptr<ConfigLoader> g_config_loader;
        inline std::unique_ptr<GlobalConfig> g_current_config;
        inline std::mutex g_config_mutex;
        inline std::atomic<bool> g_config_initialized{false};

        /**
 * Abstract base class using Template Method and Observer patterns
 */
        class ConfigLoader {
        protected:
            std::vector<ConfigObserver *> observers_;
            std::atomic<bool> monitoring_active{false};
            std::thread monitor_thread;

            virtual std::unique_ptr<GlobalConfig> createDefaultConfig() = 0;

            virtual std::unique_ptr<GlobalConfig> loadFromStaticFile() {
                return std::make_unique<GlobalConfig>(GlobalConfig::load());
            }

            virtual void startMonitoring(GlobalConfig *config) {
                if (monitoring_active.load()) return;
                monitoring_active = true;

                std::filesystem::file_time_type initial_write = {};
                std::error_code ec;
                auto path = std::filesystem::path(get_config_file_path());
                if (std::filesystem::exists(path, ec)) {
                    initial_write = std::filesystem::last_write_time(path, ec);
                }

                monitor_thread = std::thread([this, config, path, last_write = initial_write]() mutable {
                    while (monitoring_active.load()) {
                        try {
                            std::error_code ec;
                            if (std::filesystem::exists(path, ec)) {
                                auto curr_time = std::filesystem::last_write_time(path, ec);
                                if (!ec && curr_time != last_write) {
                                    PUSHHUB_INFO("Config file changed, reloading...");
                                    last_write = curr_time;
                                    auto newConfig = loadFromStaticFile();
                                    std::lock_guard<std::mutex> lock(g_config_mutex);
                                    *config = *newConfig;
                                    notifyObservers(*config);
                                }
                            }
                        } catch (const std::exception &e) {
                            PUSHHUB_ERROR("Error reloading config file: {}", e.what());
                        }
                        // Short sleeps keep shutdown responsive
                        for (int i = 0; i < 20 && monitoring_active.load(); ++i) {
                            std::this_thread::sleep_for(std::chrono::milliseconds(100));
                        }
                    }
                });
            }

            void notifyObservers(const GlobalConfig &config) {
                for (auto *obs: observers_) {
                    try {
                        obs->onConfigReloaded(config);
                    } catch (const std::exception &e) {
                        PUSHHUB_ERROR("Observer notification failed: {}", e.what());
                    }
                }
            }

        public:
            virtual ~ConfigLoader() {
                stopMonitoring();
            }

            void stopMonitoring() {
                monitoring_active = false;
                if (monitor_thread.joinable()) {
                    monitor_thread.join();
                }
            }

            void addObserver(ConfigObserver *obs) {
                if (obs) {
                    std::lock_guard<std::mutex> lock(g_config_mutex);
                    if (std::find(observers_.begin(), observers_.end(), obs) == observers_.end()) {
                        observers_.push_back(obs);
                    }
                }
            }

            void removeObserver(ConfigObserver *obs) {
                std::lock_guard<std::mutex> lock(g_config_mutex);
                observers_.erase(
                        std::remove(observers_.begin(), observers_.end(), obs),
                        observers_.end());
            }

            std::unique_ptr<GlobalConfig> load(ConfigMode mode) {
                std::unique_ptr<GlobalConfig> config;

                switch (mode) {
                    case ConfigMode::NONE:
                        config = createDefaultConfig();
                        break;
                    case ConfigMode::STATIC:
                        if (std::filesystem::exists(get_config_file_path())) {
                            config = loadFromStaticFile();
                        } else {
                            PUSHHUB_WARN("Config file not found, using default settings");
                            config = createDefaultConfig();
                        }
                        break;
                    case ConfigMode::DYNAMIC:
                        config = loadFromStaticFile();
                        startMonitoring(config.get());
                        break;
                    default:
                        config = createDefaultConfig();
                }

                notifyObservers(*config);
                return config;
            }
        };

        /**
 * Default implementation of ConfigLoader
 */
        class DefaultConfigLoader : public ConfigLoader {
        protected:
            std::unique_ptr<GlobalConfig> createDefaultConfig() override {
                auto config = std::make_unique<GlobalConfig>();
                config->title = "Default pushhub configuration";
                return config;
            }
        };

        /**
 * Write a commented default config file unless a non-empty one exists.
 */
        inline void initialize_default_config() {
            try {
                std::string config_file = get_config_file_path();
                if (std::filesystem::exists(config_file) && std::filesystem::file_size(config_file) > 0) {
                    return;
                }

                inicpp::IniManager ini(config_file);
                PUSHHUB_INFO("Creating default config file: {}", config_file);

                // [server]
                ini.set("server", "ip", "0.0.0.0");
                ini.set("server", "port", 8000);
                ini.set("server", "io_threads", 2);
                ini.set("server", "server_name", "calculator-server");
                ini.set("server", "log_level", "info");
                ini.set("server", "log_path", "logs/pushhub.log");
                ini.set("server", "max_file_size", 5242880);
                ini.set("server", "max_files", 3);

                // [hub]
                ini.set("hub", "heartbeat_interval_ms", 25000);
                ini.set("hub", "channel_capacity", 256);
                ini.set("hub", "overflow_policy", "drop_oldest");
                ini.set("hub", "send_connect_event", 1);
                ini.set("hub", "shutdown_grace_ms", 1000);

                // [notifier]
                ini.set("notifier", "list_changed_delay_ms", 500);
                ini.set("notifier", "direct_list_enabled", 1);
                ini.set("notifier", "direct_list_delay_ms", 1000);
                ini.set("notifier", "direct_list_followup_ms", 500);
                ini.set("notifier", "direct_list_ids", "tools-list-push,1");

                ini.setComment("server", "ip", "IP address the server binds to");
                ini.setComment("server", "port", "HTTP port for /sse and /messages");
                ini.setComment("server", "io_threads", "Number of io_context threads serving connections");
                ini.setComment("server", "server_name", "Name reported in the initialize reply");
                ini.setComment("server", "log_level", "Logging severity (trace, debug, info, warn, error, critical, off)");
                ini.setComment("server", "log_path", "Filesystem path for log storage");
                ini.setComment("server", "max_file_size", "Maximum size per log file in bytes");
                ini.setComment("server", "max_files", "Maximum number of rotated log files");

                ini.setComment("hub", "heartbeat_interval_ms", "Keep-alive comment after this much stream silence (at least 1000)");
                ini.setComment("hub", "channel_capacity", "Maximum queued messages per connection");
                ini.setComment("hub", "overflow_policy", "Full queue behaviour (drop_oldest, reject)");
                ini.setComment("hub", "send_connect_event", "Send a debug event when a stream opens (1=enable, 0=disable)");
                ini.setComment("hub", "shutdown_grace_ms", "How long shutdown waits for open streams to close");

                ini.setComment("notifier", "list_changed_delay_ms", "Delay of tools/list_changed after initialized");
                ini.setComment("notifier", "direct_list_enabled", "Push unsolicited tools lists after initialize (1=enable, 0=disable)");
                ini.setComment("notifier", "direct_list_delay_ms", "Delay before the first direct push");
                ini.setComment("notifier", "direct_list_followup_ms", "Delay between list_changed and the tools lists");
                ini.setComment("notifier", "direct_list_ids", "Comma separated ids of the pushed tools lists");

                ini.set("title", "pushhub configuration");
                ini.setComment("title", "Auto-generated configuration file");
                ini.parse();

                PUSHHUB_INFO("Default config created successfully");
            } catch (const std::exception &e) {
                PUSHHUB_ERROR("Failed to initialize default config: {}", e.what());
                throw;
            }
        }

        inline void print_config(const GlobalConfig &config) {
            PUSHHUB_INFO("===== pushhub configuration =====");
            PUSHHUB_INFO("Title: {}", config.title);
            PUSHHUB_INFO("Listen: {}:{} ({} io threads)", config.server.ip, config.server.port, config.server.io_threads);
            PUSHHUB_INFO("Server name: {}", config.server.server_name);
            PUSHHUB_INFO("Log: {} at {}", config.server.log_path, config.server.log_level);
            PUSHHUB_INFO("Heartbeat: {} ms", config.hub.heartbeat_interval_ms);
            PUSHHUB_INFO("Channel: capacity {}, overflow {}", config.hub.channel_capacity, config.hub.overflow_policy);
            PUSHHUB_INFO("Direct tools list push: {}", config.notifier.direct_list_enabled ? "enabled" : "disabled");
            PUSHHUB_INFO("=================================");
        }

        /**
 * Initialize the config system. STATIC and DYNAMIC create the default
 * file first when it is missing.
 */
        inline void initialize_config_system(ConfigMode mode = ConfigMode::STATIC) {
            if (g_config_initialized.load()) return;

            if (mode != ConfigMode::NONE) {
                initialize_default_config();
            }
            g_config_loader = std::make_unique<DefaultConfigLoader>();
            {
                std::lock_guard<std::mutex> lock(g_config_mutex);
                g_current_config = g_config_loader->load(mode);
            }
            g_config_initialized = true;
        }

        /**
 * Get current config (thread-safe)
 */
        inline GlobalConfig get_current_config() {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            return *g_current_config;
        }

    }// namespace config
}// namespace pushhub

#endif// PUSHHUB_CONFIG_HPP
