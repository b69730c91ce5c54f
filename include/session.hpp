/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_SESSION_HPP
#define HPLAYER_SESSION_HPP

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sys/types.h>

#include <nlohmann/json.hpp>

namespace hplayer::session {

    enum class PlaybackState : int {
        Idle,       // no process
        Starting,   // process spawned, channel not ready yet
        Ready,      // channel ready, nothing playing
        Playing,
        Paused,
        Stopping,
        Failed      // reason kept in Session::last_error
    };

    const char *state_name(PlaybackState s);

    /// Playing or Paused.
    bool is_active(PlaybackState s);

    /**
     * @brief The single live relationship between the controller and one player process.
     */
    struct Session {
        uint64_t generation = 0;           // bumped on every start, stale events carry an older one
        pid_t pid = -1;
        std::string endpoint;              // IPC socket path
        int64_t created_at = 0;            // epoch seconds
        PlaybackState state = PlaybackState::Idle;
        std::optional<std::string> media;  // name inside the media directory
        double position = 0.0;
        double duration = 0.0;
        int volume = 100;
        std::string output_route = "auto";
        std::optional<std::string> last_error;
    };

    /**
     * @brief What callers see of the session.
     */
    struct SessionView {
        PlaybackState state = PlaybackState::Idle;
        std::optional<std::string> current_file;
        double position = 0.0;
        double duration = 0.0;
        int volume = 100;
        bool paused = false;
        std::string output_route = "auto";
        std::optional<std::string> last_error;
    };

    SessionView make_view(const Session &s);

    nlohmann::json to_json(const SessionView &v);

    /**
     * @brief A file in the managed media directory.
     */
    struct MediaFile {
        std::string name;
        uint64_t size = 0;
        int64_t modified = 0;  // epoch seconds
    };

    nlohmann::json to_json(const MediaFile &f);

} // namespace hplayer::session

#endif // HPLAYER_SESSION_HPP
