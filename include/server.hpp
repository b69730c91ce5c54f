/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_SERVER_HPP
#define HPLAYER_SERVER_HPP

#pragma once

#include <common.hpp>
#include <controller.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace hplayer {
    namespace server {

        using hplayer::common::sock_t;

// Connection state machine
        enum class State : int {
            READING,      // waiting for a complete request line
            PROCESSING,   // one controller command in flight
            WRITING,      // reply partially sent
            UPLOADING,    // socket handed to an upload thread
            CLOSING
        };

        struct Connection {
            sock_t tcp_fd;
            uint32_t clientId;
            State state;
            std::string inBuffer;    // raw bytes received, may hold several lines
            std::string outBuffer;   // reply bytes not yet sent
            std::optional<std::future<controller::OpResult>> pending;
            std::string pendingOp;
            bool closeAfterWrite;

            Connection() : tcp_fd(INVALID_SOCK), clientId(0), state(State::READING), closeAfterWrite(false) {}
            explicit Connection(sock_t s) : tcp_fd(s), clientId(0), state(State::READING), closeAfterWrite(false) {}
        };

        /**
         * @brief What a request line turned into.
         *
         * Exactly one of: an immediate reply, a pending controller result, or an upload to start.
         */
        struct Dispatch {
            std::optional<nlohmann::json> reply;
            std::optional<std::future<controller::OpResult>> pending;
            std::string op;

            bool upload = false;
            std::string uploadName;
            uint64_t uploadSize = 0;
        };

        nlohmann::json error_reply(common::ErrorCode code, const std::string &message);

        /**
         * @brief Decode one JSON request line and route it to the controller.
         *
         * status/health/files/config/config_set are answered inline; playback
         * operations and delete are queued on the controller.
         */
        Dispatch dispatch_request(controller::Controller &ctl, const std::string &line);

        /**
         * @brief JSON-lines control server on top of epoll.
         *
         * Each connection has at most one request in flight; further lines wait in
         * its buffer. Uploads leave the event loop for their own thread and the
         * socket comes back once the reply is ready.
         */
        class Server {
        public:
            Server(int tcpPort, controller::Controller &ctl);
            ~Server();

            bool start();
            void runLoop();

            /// Ask runLoop() to return. Safe from signal-driven threads.
            void stop();

            /// Bound port (useful when constructed with port 0).
            int port() const { return tcpPort_; }

            /// Upload threads not yet joined by the loop.
            size_t uploadThreadCount();

        private:
            bool setupListenSocket();
            void acceptNewConnections();
            void handleTcpEvent(sock_t fd, uint32_t events = 0);
            void processBufferedRequests(Connection &c);
            void checkPending(Connection &c);
            void queueReply(Connection &c, const nlohmann::json &reply);
            void flushOutBuffer(Connection &c);
            void beginUpload(Connection &c, Dispatch &d);
            void uploadWorker(Connection conn, transfer::UploadId id, uint64_t size);
            void collectReturnedUploads();
            void closeConnection(sock_t fd);

        private:
            int tcpPort_;
            sock_t tcpListenSocket_;
            int epollFd_;
            std::unordered_map<sock_t, Connection> clients_; // key is TCP socket fd
            uint32_t nextClientId_;
            controller::Controller &ctl_;
            std::atomic<bool> stop_;

            std::mutex uploadMtx_;
            std::unordered_map<sock_t, std::thread> uploadThreads_;  // joined when the socket comes back
            std::unordered_set<sock_t> uploadFds_;
            std::vector<Connection> returned_;  // upload connections ready to rejoin the loop
        };

    } // namespace server
} // namespace hplayer

#endif // HPLAYER_SERVER_HPP
