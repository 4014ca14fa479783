#pragma once

#include <memory>
#include <string>

// Include format library for format string support
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

#define PUSHHUB_TRACE(...) ::pushhub::core::HubLogger::instance().trace(__VA_ARGS__)
#define PUSHHUB_DEBUG(...) ::pushhub::core::HubLogger::instance().debug(__VA_ARGS__)
#define PUSHHUB_INFO(...) ::pushhub::core::HubLogger::instance().info(__VA_ARGS__)
#define PUSHHUB_WARN(...) ::pushhub::core::HubLogger::instance().warn(__VA_ARGS__)
#define PUSHHUB_ERROR(...) ::pushhub::core::HubLogger::instance().error(__VA_ARGS__)
#define PUSHHUB_CRITICAL(...) ::pushhub::core::HubLogger::instance().critical(__VA_ARGS__)

namespace pushhub::core {

    /**
     * @brief Log levels for the logger
     */
    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    // global logger instance, null until initializeAsyncLogger() ran
    extern std::shared_ptr<spdlog::logger> g_logger;
    extern LogLevel g_current_level;

    /**
     * @brief Map a level name (trace, debug, info, warn, error, critical, off) to LogLevel.
     * Unknown names map to INFO.
     */
    LogLevel parse_log_level(const std::string &name);

    /**
     * @brief Thin wrapper over the global spdlog logger.
     * Every call is a no-op while the logger is not initialized.
     */
    class HubLogger {
    public:
        static HubLogger &instance();

        std::shared_ptr<spdlog::logger> operator->();

        template<typename... Args>
        void trace(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void debug(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void critical(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
        }

        // Overloads for string literals (without format arguments)
        void trace(const char *msg);
        void debug(const char *msg);
        void info(const char *msg);
        void warn(const char *msg);
        void error(const char *msg);
        void critical(const char *msg);

        void set_level(LogLevel level);
        LogLevel get_level() const;

    private:
        HubLogger() = default;

        void write(LogLevel level, const char *msg);

        template<typename... Args>
        void log(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) {
            if (!g_logger || static_cast<int>(level) < static_cast<int>(g_current_level)) {
                return;
            }

            try {
                std::string formatted_msg = fmt::format(fmt, std::forward<Args>(args)...);
                write(level, formatted_msg.c_str());
            } catch (const std::exception &e) {
                // Fallback in case of formatting error
                g_logger->error("Log formatting error: {}", e.what());
            }
        }
    };

    /**
     * @brief Initialize global spdlog in asynchronous mode
     * @param log_path Log file path
     * @param log_level Log level (trace, debug, info, warn, error, critical, off)
     * @param max_file_size Maximum size of each log file (bytes)
     * @param max_files Maximum number of log files
     */
    void initializeAsyncLogger(
            const std::string &log_path,
            const std::string &log_level = "info",
            size_t max_file_size = 1048576 * 5,// 5MB
            size_t max_files = 3);

    // Flush and drop the global logger; later log calls are no-ops.
    void shutdownLogger();

}// namespace pushhub::core
