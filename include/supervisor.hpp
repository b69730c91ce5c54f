/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_SUPERVISOR_HPP
#define HPLAYER_SUPERVISOR_HPP

#pragma once

#include <channel.hpp>
#include <common.hpp>
#include <player.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hplayer::supervisor {

    /**
     * @brief Everything the player is bound to at spawn time.
     */
    struct SpawnOptions {
        std::string player_cmd = "mpv";
        std::string runtime_dir = "/tmp";
        int volume = 100;
        std::string output_route = "auto";
        bool hardware_accel = true;
        bool audio_in_headless = true;
        std::string audio_device = "auto";
        bool loop = false;
        std::vector<std::string> extra_args;
        int connect_attempts = common::CHANNEL_CONNECT_ATTEMPTS;
        int connect_wait_ms = common::CHANNEL_CONNECT_WAIT_MS;
    };

    struct SessionInfo {
        uint64_t generation = 0;
        pid_t pid = -1;
        std::string endpoint;
        int64_t created_at = 0;
    };

    /// Headless mpv argument list; @p audio_device empty = let the player choose.
    std::vector<std::string> build_player_args(const SpawnOptions &opts, const std::string &socket_path,
                                               const std::string &media_path, const std::string &audio_device);

    /// First HDMI sink reported by "aplay -L" as "alsa/<name>", "alsa/default" when none, empty on failure.
    std::string detect_hdmi_audio();

    /// Per-session socket path inside @p runtime_dir.
    std::string make_endpoint(const std::string &runtime_dir, uint64_t generation);

    /**
     * @brief Owns the player process and its command channel.
     *
     * Not thread-safe: driven exclusively by the controller worker.
     */
    class ProcessSupervisor {
    public:
        explicit ProcessSupervisor(int reply_timeout_ms = common::CHANNEL_REPLY_TIMEOUT_MS);
        ~ProcessSupervisor();

        ProcessSupervisor(const ProcessSupervisor&) = delete;
        ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

        /**
         * @brief Spawn a player for @p media_path and connect its channel.
         *
         * Any running player is stopped first.
         * @return None, SpawnError (exec failure or early exit) or ChannelUnavailable
         */
        common::ErrorCode start(uint64_t generation, const std::string &media_path, const SpawnOptions &opts,
                                SessionInfo &info, std::string &error);

        /**
         * @brief Stop the player. Graceful sends "quit" and waits up to 5 s, then
         * SIGTERM / SIGKILL. The socket file is always removed. Idempotent.
         */
        void stop(bool graceful);

        /**
         * @brief Liveness check.
         * @return true if the player exited since the last check; resources are released
         * and @p reason describes the exit.
         */
        bool probe(std::string &reason);

        pid_t pid() const;

        channel::CommandChannel &channel() { return channel_; }

    private:
        void release();

        channel::CommandChannel channel_;
        std::unique_ptr<player::PlayerProcess> process_;
        std::string endpoint_;
        std::optional<std::string> audio_device_cache_;
    };

} // namespace hplayer::supervisor

#endif // HPLAYER_SUPERVISOR_HPP
