#include "logger.h"
#include <memory>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pushhub::core {

    std::shared_ptr<spdlog::logger> g_logger = nullptr;
    LogLevel g_current_level = LogLevel::INFO;

    LogLevel parse_log_level(const std::string &name) {
        if (name == "trace") return LogLevel::TRACE;
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERR;
        if (name == "critical") return LogLevel::CRITICAL;
        if (name == "off") return LogLevel::OFF;
        return LogLevel::INFO;
    }

    HubLogger &HubLogger::instance() {
        static HubLogger instance;
        return instance;
    }

    // allow access to the underlying spdlog::logger
    std::shared_ptr<spdlog::logger> HubLogger::operator->() {
        return g_logger;
    }

    void HubLogger::set_level(LogLevel level) {
        g_current_level = level;
        if (g_logger) {
            g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(level)));
        }
    }

    LogLevel HubLogger::get_level() const {
        return g_current_level;
    }

    void HubLogger::write(LogLevel level, const char *msg) {
        if (!g_logger || static_cast<int>(level) < static_cast<int>(g_current_level)) {
            return;
        }
        switch (level) {
            case LogLevel::TRACE:
                g_logger->trace(msg);
                break;
            case LogLevel::DEBUG:
                g_logger->debug(msg);
                break;
            case LogLevel::WARN:
                g_logger->warn(msg);
                break;
            case LogLevel::ERR:
                g_logger->error(msg);
                break;
            case LogLevel::CRITICAL:
                g_logger->critical(msg);
                break;
            default:
                g_logger->info(msg);
                break;
        }
    }

    void HubLogger::trace(const char *msg) { write(LogLevel::TRACE, msg); }
    void HubLogger::debug(const char *msg) { write(LogLevel::DEBUG, msg); }
    void HubLogger::info(const char *msg) { write(LogLevel::INFO, msg); }
    void HubLogger::warn(const char *msg) { write(LogLevel::WARN, msg); }
    void HubLogger::error(const char *msg) { write(LogLevel::ERR, msg); }
    void HubLogger::critical(const char *msg) { write(LogLevel::CRITICAL, msg); }

    void initializeAsyncLogger(const std::string &log_path, const std::string &log_level, size_t max_file_size,
                               size_t max_files) {
        spdlog::init_thread_pool(8192, 1);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_color_mode(spdlog::color_mode::automatic);
        console_sink->set_color(spdlog::level::trace, "\033[36m");           // Cyan
        console_sink->set_color(spdlog::level::debug, "\033[34m");           // Blue
        console_sink->set_color(spdlog::level::info, "\033[32m");            // Green
        console_sink->set_color(spdlog::level::warn, "\033[33m");            // Yellow
        console_sink->set_color(spdlog::level::err, "\033[31m");             // Red
        console_sink->set_color(spdlog::level::critical, "\033[41m\033[37m");// White on red background

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, max_file_size, max_files);

        g_logger = std::make_shared<spdlog::async_logger>(
                "pushhub", spdlog::sinks_init_list{console_sink, file_sink},
                spdlog::thread_pool(), spdlog::async_overflow_policy::block);
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t:%t] %v");
        HubLogger::instance().set_level(parse_log_level(log_level));

        spdlog::register_logger(g_logger);
        spdlog::set_default_logger(g_logger);

        // Start periodic flushing (every 3 seconds)
        spdlog::flush_every(std::chrono::seconds(3));
    }

    void shutdownLogger() {
        if (g_logger) {
            g_logger->flush();
        }
        g_logger = nullptr;
        spdlog::shutdown();
    }

}// namespace pushhub::core
