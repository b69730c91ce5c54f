/*
* @license
* (C) zachbabanov
*
*/

#include <state_machine.hpp>
#include <logger.hpp>

#include <type_traits>

using namespace hplayer::state;
using namespace hplayer::session;
using namespace hplayer::events;

namespace hplayer::state {

    const char *trigger_name(Trigger t) {
        switch (t) {
            case Trigger::Start:         return "start";
            case Trigger::ChannelReady:  return "channel-ready";
            case Trigger::StartFailed:   return "start-failed";
            case Trigger::Play:          return "play";
            case Trigger::Pause:         return "pause";
            case Trigger::Resume:        return "resume";
            case Trigger::Stop:          return "stop";
            case Trigger::ProcessExited: return "process-exited";
            case Trigger::EndOfFile:     return "end-of-file";
            case Trigger::ProcessDied:   return "process-died";
            case Trigger::Reset:         return "reset";
        }
        return "unknown";
    }

    std::optional<PlaybackState> next_state(PlaybackState from, Trigger t) {
        switch (from) {
            case PlaybackState::Idle:
                if (t == Trigger::Start) return PlaybackState::Starting;
                break;
            case PlaybackState::Starting:
                if (t == Trigger::ChannelReady) return PlaybackState::Ready;
                if (t == Trigger::StartFailed) return PlaybackState::Failed;
                if (t == Trigger::Stop) return PlaybackState::Stopping;
                if (t == Trigger::ProcessDied) return PlaybackState::Failed;
                break;
            case PlaybackState::Ready:
                if (t == Trigger::Play) return PlaybackState::Playing;
                if (t == Trigger::Stop) return PlaybackState::Stopping;
                if (t == Trigger::ProcessDied) return PlaybackState::Failed;
                break;
            case PlaybackState::Playing:
                if (t == Trigger::Pause) return PlaybackState::Paused;
                if (t == Trigger::Stop) return PlaybackState::Stopping;
                if (t == Trigger::EndOfFile) return PlaybackState::Ready;
                if (t == Trigger::ProcessDied) return PlaybackState::Failed;
                break;
            case PlaybackState::Paused:
                if (t == Trigger::Resume) return PlaybackState::Playing;
                if (t == Trigger::Stop) return PlaybackState::Stopping;
                if (t == Trigger::EndOfFile) return PlaybackState::Ready;
                if (t == Trigger::ProcessDied) return PlaybackState::Failed;
                break;
            case PlaybackState::Stopping:
                if (t == Trigger::ProcessExited) return PlaybackState::Idle;
                if (t == Trigger::ProcessDied) return PlaybackState::Failed;
                break;
            case PlaybackState::Failed:
                if (t == Trigger::Start) return PlaybackState::Starting;
                if (t == Trigger::Reset) return PlaybackState::Idle;
                break;
        }
        return std::nullopt;
    }

} // namespace hplayer::state

bool StateMachine::apply(Trigger t, const std::string &detail) {
    std::lock_guard<std::mutex> lk(mtx_);
    return apply_locked(t, detail);
}

bool StateMachine::apply_locked(Trigger t, const std::string &detail) {
    auto next = next_state(session_.state, t);
    if (!next) {
        LOG_PLAY_DEBUG("No edge from {} on {}", state_name(session_.state), trigger_name(t));
        return false;
    }
    PlaybackState prev = session_.state;
    session_.state = *next;

    switch (t) {
        case Trigger::Start:
            session_.last_error.reset();
            session_.media.reset();
            session_.position = 0.0;
            session_.duration = 0.0;
            break;
        case Trigger::Play:
            if (!detail.empty()) session_.media = detail;
            break;
        case Trigger::StartFailed:
        case Trigger::ProcessDied:
            session_.last_error = detail.empty() ? std::string(trigger_name(t)) : detail;
            session_.pid = -1;
            break;
        default:
            break;
    }
    if (*next == PlaybackState::Idle) {
        session_.pid = -1;
        session_.endpoint.clear();
        session_.media.reset();
        session_.position = 0.0;
        session_.duration = 0.0;
        if (t == Trigger::Reset) session_.last_error.reset();
    }

    LOG_PLAY_INFO("State {} -> {} ({}{}{})", state_name(prev), state_name(*next), trigger_name(t),
                  detail.empty() ? "" : ": ", detail);
    return true;
}

bool StateMachine::on_event(const PlayerEvent &ev) {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::visit([this](const auto &e) -> bool {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PositionChanged>) {
            session_.position = e.seconds;
            return false;
        } else if constexpr (std::is_same_v<T, DurationChanged>) {
            session_.duration = e.seconds;
            return false;
        } else if constexpr (std::is_same_v<T, VolumeChanged>) {
            session_.volume = e.level;
            return false;
        } else if constexpr (std::is_same_v<T, PauseChanged>) {
            if (e.paused && session_.state == PlaybackState::Playing) return apply_locked(Trigger::Pause, {});
            if (!e.paused && session_.state == PlaybackState::Paused) return apply_locked(Trigger::Resume, {});
            return false;
        } else if constexpr (std::is_same_v<T, EndOfFile>) {
            if (!is_active(session_.state)) return false;
            return apply_locked(Trigger::EndOfFile, e.reason);
        } else {
            // channel loss is judged by the controller together with the liveness probe
            return false;
        }
    }, ev);
}

void StateMachine::attach_process(uint64_t generation, pid_t pid, const std::string &endpoint, int64_t created_at) {
    std::lock_guard<std::mutex> lk(mtx_);
    session_.generation = generation;
    session_.pid = pid;
    session_.endpoint = endpoint;
    session_.created_at = created_at;
}

void StateMachine::update_progress(std::optional<double> position, std::optional<double> duration, std::optional<int> volume) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (position) session_.position = *position;
    if (duration) session_.duration = *duration;
    if (volume) session_.volume = *volume;
}

void StateMachine::set_volume(int volume) {
    std::lock_guard<std::mutex> lk(mtx_);
    session_.volume = volume;
}

void StateMachine::set_output_route(const std::string &route) {
    std::lock_guard<std::mutex> lk(mtx_);
    session_.output_route = route;
}

PlaybackState StateMachine::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return session_.state;
}

Session StateMachine::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return session_;
}

SessionView StateMachine::view() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return make_view(session_);
}
