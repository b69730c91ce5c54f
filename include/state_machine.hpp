/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_STATE_MACHINE_HPP
#define HPLAYER_STATE_MACHINE_HPP

#pragma once

#include <events.hpp>
#include <session.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace hplayer::state {

    using session::PlaybackState;

    enum class Trigger : int {
        Start,          // caller asked for a new session
        ChannelReady,   // supervisor connected the channel
        StartFailed,    // spawn error or channel never came up
        Play,           // dispatcher confirmed playback of a file
        Pause,
        Resume,
        Stop,           // teardown requested
        ProcessExited,  // expected exit during teardown
        EndOfFile,      // player reported end of media
        ProcessDied,    // unexpected exit or unresponsive player
        Reset           // caller cleared a failed session
    };

    const char *trigger_name(Trigger t);

    /// The transition table. std::nullopt when no edge leaves @p from on @p t.
    std::optional<PlaybackState> next_state(PlaybackState from, Trigger t);

    /**
     * @brief Authoritative playback state plus the continuous session fields.
     *
     * All mutators are called from the controller worker only. Readers on any
     * thread get a consistent copy through snapshot()/view(); the mutex is held
     * only for the duration of a field update or a copy.
     */
    class StateMachine {
    public:
        StateMachine() = default;

        /**
         * @brief Follow the edge for @p t.
         * @param detail media name for Play, failure reason for StartFailed/ProcessDied
         * @return false and no change when the edge does not exist
         */
        bool apply(Trigger t, const std::string &detail = {});

        /**
         * @brief Fold a player notification into the session.
         * @return true when the enumerated state changed
         */
        bool on_event(const events::PlayerEvent &ev);

        /// Bind the identity of a freshly spawned process.
        void attach_process(uint64_t generation, pid_t pid, const std::string &endpoint, int64_t created_at);

        /// Poll results; none of them alter the enumerated state.
        void update_progress(std::optional<double> position, std::optional<double> duration, std::optional<int> volume);

        void set_volume(int volume);
        void set_output_route(const std::string &route);

        PlaybackState state() const;
        session::Session snapshot() const;
        session::SessionView view() const;

    private:
        bool apply_locked(Trigger t, const std::string &detail);

        mutable std::mutex mtx_;
        session::Session session_;
    };

} // namespace hplayer::state

#endif // HPLAYER_STATE_MACHINE_HPP
