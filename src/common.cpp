#include "common.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>

#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

#include <fmt/core.h>

namespace hplayer {
    namespace common {

        using namespace hplayer::log;

        const char *error_name(ErrorCode code) {
            switch (code) {
                case ErrorCode::None:               return "None";
                case ErrorCode::ValidationError:    return "ValidationError";
                case ErrorCode::InvalidFilename:    return "InvalidFilename";
                case ErrorCode::ChannelUnavailable: return "ChannelUnavailable";
                case ErrorCode::ChannelTimeout:     return "ChannelTimeout";
                case ErrorCode::ChannelClosed:      return "ChannelClosed";
                case ErrorCode::CommandRejected:    return "CommandRejected";
                case ErrorCode::SpawnError:         return "SpawnError";
                case ErrorCode::Busy:               return "Busy";
                case ErrorCode::NoActiveSession:    return "NoActiveSession";
                case ErrorCode::TransferFailed:     return "TransferFailed";
                case ErrorCode::Conflict:           return "Conflict";
                case ErrorCode::IoError:            return "IoError";
            }
            return "Unknown";
        }

        bool is_validation_error(ErrorCode code) {
            return code == ErrorCode::ValidationError || code == ErrorCode::InvalidFilename;
        }

        bool is_transient_channel_error(ErrorCode code) {
            return code == ErrorCode::ChannelTimeout || code == ErrorCode::ChannelClosed;
        }

        int setSocketNonBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_INFO("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_INFO("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        int setSocketBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_INFO("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == -1) {
                LOG_NET_INFO("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        void closeSocket(sock_t fd) {
            if (fd >= 0) {
                close(fd);
                LOG_NET_DEBUG("socket closed: {}", fd);
            }
        }

        int enableSocketKeepAliveAndNoDelay(sock_t fd) {
            int on = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0) {
                LOG_NET_INFO("setsockopt(SO_KEEPALIVE) failed fd={} err={}", fd, strerror(errno));
            }
            // platform-specific keepalive tuning (best-effort)
#ifdef TCP_KEEPIDLE
            int idle = 30;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
#ifdef TCP_KEEPINTVL
            int interval = 5;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
#endif
#ifdef TCP_KEEPCNT
            int cnt = 3;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif

            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) != 0) {
                LOG_NET_INFO("setsockopt(TCP_NODELAY) failed fd={} err={}", fd, strerror(errno));
            }
            return 0;
        }

        bool sendAll(sock_t fd, const char *buf, size_t len) {
            size_t off = 0;
            while (off < len) {
                ssize_t n = ::send(fd, buf + off, len - off, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    LOG_NET_DEBUG("send failed fd={} err={}", fd, strerror(errno));
                    return false;
                }
                off += (size_t)n;
            }
            return true;
        }

        std::string iso_time(int64_t epoch_seconds) {
            std::time_t t = (std::time_t)epoch_seconds;
            std::tm tm{};
            localtime_r(&t, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
            return std::string(buf);
        }

        std::string iso_time_now() {
            return iso_time((int64_t)std::time(nullptr));
        }

    } // namespace common
} // namespace hplayer
