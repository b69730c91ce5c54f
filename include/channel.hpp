/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_CHANNEL_HPP
#define HPLAYER_CHANNEL_HPP

#pragma once

#include <common.hpp>
#include <events.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace hplayer::channel {

    using EventSink = std::function<void(const events::PlayerEvent &)>;

    /**
     * @brief Newline-framed JSON request/reply transport to the player's IPC socket.
     *
     * - Every request gets a request_id; send() waits for the reply carrying the same id.
     * - Asynchronous notifications (messages with an "event" key) are decoded into
     *   typed events on a dedicated reader thread and handed to the observer sink.
     * - The sink stays registered across close()/connect() cycles.
     */
    class CommandChannel {
    public:
        explicit CommandChannel(int reply_timeout_ms = common::CHANNEL_REPLY_TIMEOUT_MS);
        ~CommandChannel();

        CommandChannel(const CommandChannel&) = delete;
        CommandChannel& operator=(const CommandChannel&) = delete;

        /**
         * @brief Connect to the socket of an already spawned player.
         *
         * The player creates its socket asynchronously, so up to @p attempts connects
         * are made, spread over @p total_wait_ms. @p alive is consulted before each
         * attempt; returning false aborts the wait early.
         * @return ErrorCode::None or ErrorCode::ChannelUnavailable
         */
        common::ErrorCode connect(const std::string &path, bool owns_endpoint,
                                  int attempts = common::CHANNEL_CONNECT_ATTEMPTS,
                                  int total_wait_ms = common::CHANNEL_CONNECT_WAIT_MS,
                                  const std::function<bool()> &alive = nullptr);

        /**
         * @brief Send one command (a JSON array such as ["seek", 30, "absolute"]) and wait for its reply.
         * @param reply full reply object on success or CommandRejected
         * @return None, ChannelTimeout, ChannelClosed or CommandRejected
         */
        common::ErrorCode send(const nlohmann::json &command, nlohmann::json &reply);
        common::ErrorCode send(const nlohmann::json &command);

        common::ErrorCode get_property(const std::string &name, nlohmann::json &value);
        common::ErrorCode set_property(const std::string &name, const nlohmann::json &value);

        /// Register the event sink (replaces any previous one).
        void observe(EventSink sink);

        /// Close the socket, stop the reader and unlink the endpoint if owned. Idempotent.
        void close();

        bool is_connected() const;
        const std::string &endpoint() const { return path_; }

    private:
        void reader_loop();
        void handle_line(const std::string &line);
        void emit(const events::PlayerEvent &ev);

        int timeout_ms_;
        common::sock_t fd_;
        std::string path_;
        bool owns_endpoint_;

        std::atomic<bool> running_;
        std::thread reader_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        bool closed_;
        uint64_t next_request_id_;
        std::unordered_set<uint64_t> pending_;
        std::unordered_map<uint64_t, nlohmann::json> replies_;

        std::mutex write_mtx_;

        std::mutex sink_mtx_;
        EventSink sink_;
    };

} // namespace hplayer::channel

#endif // HPLAYER_CHANNEL_HPP
