/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_COMMON_HPP
#define HPLAYER_COMMON_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#define INVALID_SOCK (-1)

namespace hplayer {
    namespace common {
        using sock_t = int;

// Constants used across controller/server/client
        constexpr size_t BUFFER_SIZE = 4096;
        constexpr size_t MAX_CLIENTS = 16;
        constexpr size_t MAX_REQUEST_LINE = 64 * 1024;             // one JSON request line
        constexpr size_t TRANSFER_CHUNK_SIZE = 8 * 1024;           // upload read/write chunk
        constexpr uint64_t DEFAULT_MAX_UPLOAD = 2147483648ULL;     // 2 GiB

//
// Validation bounds
//
        constexpr int VOLUME_MIN = 0;
        constexpr int VOLUME_MAX = 150;       // mpv allows amplification above 100
        constexpr double SEEK_MIN = 0.0;
        constexpr double SEEK_MAX = 86400.0;  // 24 hours
        constexpr double SKIP_MIN = -3600.0;
        constexpr double SKIP_MAX = 3600.0;

//
// Timing (milliseconds)
//
        constexpr int CHANNEL_REPLY_TIMEOUT_MS = 3000;
        constexpr int CHANNEL_CONNECT_ATTEMPTS = 10;
        constexpr int CHANNEL_CONNECT_WAIT_MS = 2000;
        constexpr int GRACEFUL_QUIT_TIMEOUT_MS = 5000;
        constexpr int TERM_GRACE_MS = 1000;
        constexpr int POLL_INTERVAL_MS = 1000;
        constexpr int PROBE_INTERVAL_MS = 500;
        constexpr int MAX_CHANNEL_FAILURES = 3;

        /**
         * @brief Error taxonomy shared by every layer of the controller.
         */
        enum class ErrorCode : int {
            None = 0,
            ValidationError,
            InvalidFilename,
            ChannelUnavailable,
            ChannelTimeout,
            ChannelClosed,
            CommandRejected,
            SpawnError,
            Busy,
            NoActiveSession,
            TransferFailed,
            Conflict,
            IoError
        };

        const char *error_name(ErrorCode code);

        /// True for errors caused by caller input (safe to surface verbatim).
        bool is_validation_error(ErrorCode code);

        /// True for channel errors that may clear up on retry.
        bool is_transient_channel_error(ErrorCode code);

//
// Utility functions
//
        int setSocketNonBlocking(sock_t fd);
        int setSocketBlocking(sock_t fd);
        void closeSocket(sock_t fd);
        int enableSocketKeepAliveAndNoDelay(sock_t fd);

        /// Write the whole buffer, retrying on EINTR / short writes. Returns false on error.
        bool sendAll(sock_t fd, const char *buf, size_t len);

        /// Wall-clock time as ISO-8601 local time ("2024-01-31T12:00:00").
        std::string iso_time(int64_t epoch_seconds);
        std::string iso_time_now();

    } // namespace common
} // namespace hplayer

#endif // HPLAYER_COMMON_HPP
