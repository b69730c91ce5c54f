/*
* @license
* (C) zachbabanov
*
*/

#include <session.hpp>
#include <common.hpp>

using json = nlohmann::json;

namespace hplayer::session {

    const char *state_name(PlaybackState s) {
        switch (s) {
            case PlaybackState::Idle:     return "idle";
            case PlaybackState::Starting: return "starting";
            case PlaybackState::Ready:    return "ready";
            case PlaybackState::Playing:  return "playing";
            case PlaybackState::Paused:   return "paused";
            case PlaybackState::Stopping: return "stopping";
            case PlaybackState::Failed:   return "failed";
        }
        return "unknown";
    }

    bool is_active(PlaybackState s) {
        return s == PlaybackState::Playing || s == PlaybackState::Paused;
    }

    SessionView make_view(const Session &s) {
        SessionView v;
        v.state = s.state;
        v.current_file = s.media;
        v.position = s.position;
        v.duration = s.duration;
        v.volume = s.volume;
        v.paused = s.state == PlaybackState::Paused;
        v.output_route = s.output_route;
        v.last_error = s.last_error;
        return v;
    }

    json to_json(const SessionView &v) {
        json j;
        j["state"] = state_name(v.state);
        j["current_file"] = v.current_file ? json(*v.current_file) : json(nullptr);
        j["position"] = v.position;
        j["duration"] = v.duration;
        j["volume"] = v.volume;
        j["is_paused"] = v.paused;
        j["output_route"] = v.output_route;
        j["last_error"] = v.last_error ? json(*v.last_error) : json(nullptr);
        return j;
    }

    json to_json(const MediaFile &f) {
        json j;
        j["name"] = f.name;
        j["size"] = f.size;
        j["modified"] = common::iso_time(f.modified);
        return j;
    }

} // namespace hplayer::session
