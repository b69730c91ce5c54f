/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_LOGGER_HPP
#define HPLAYER_LOGGER_HPP

#pragma once

#include <iomanip>
#include <fstream>
#include <string>
#include <chrono>
#include <atomic>
#include <mutex>
#include <ctime>

#include <fmt/core.h>

namespace hplayer::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Categories to attach to each log line.
 */
    enum class Category {
        GENERAL,
        CHANNEL,
        PROCESS,
        PLAYBACK,
        TRANSFER,
        NETWORK
    };

    /// Map "debug"/"info"/"warn"/"error" (any case) to a level; returns false for anything else.
    bool parse_level(const std::string &s, Level &out);

    const char *level_name(Level l);

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   Logger::instance().log(Level::INFO, Category::GENERAL, "message", __FILE__, __LINE__);
 *   LOG_GEN_INFO("Hello {}", name);
 */
    class Logger {
    public:
        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);

        Level level() const;

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - convenience template that formats a message using fmt.
         *
         * Uses fmt::format_to with std::back_inserter to avoid conversion via internal memory_buffer->to_string.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, Args&&... args) {
            if (lvl < min_level_.load()) return;
            std::string msg;
            try {
                if (fmt_str && fmt_str[0] != '\0') {
                    fmt::format_to(std::back_inserter(msg), fmt::runtime(fmt_str), std::forward<Args>(args)...);
                }
            } catch (const std::exception &e) {
                // formatting error: keep the raw format string so the line is not lost
                msg = std::string("[format_error:") + e.what() + "] " + (fmt_str ? fmt_str : "");
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;

        std::string timestamp_now();

        // non-copyable
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

// Convenience macros for easy calls (automatically add file:line)
#define LOG_GEN_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_CHAN_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::CHANNEL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CHAN_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::CHANNEL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CHAN_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::CHANNEL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CHAN_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::CHANNEL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CHAN_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::CHANNEL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_PROC_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_PLAY_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::PLAYBACK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAY_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::PLAYBACK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAY_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::PLAYBACK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAY_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::PLAYBACK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAY_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::PLAYBACK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_XFER_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::TRANSFER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_XFER_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::TRANSFER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_XFER_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::TRANSFER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_XFER_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::TRANSFER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_XFER_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::TRANSFER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::TRACE, hplayer::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::DEBUG, hplayer::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::INFO,  hplayer::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  hplayer::log::Logger::instance().logf(hplayer::log::Level::WARN,  hplayer::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) hplayer::log::Logger::instance().logf(hplayer::log::Level::ERROR, hplayer::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace hplayer::log

#endif // HPLAYER_LOGGER_HPP
