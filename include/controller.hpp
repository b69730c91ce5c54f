/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_CONTROLLER_HPP
#define HPLAYER_CONTROLLER_HPP

#pragma once

#include <common.hpp>
#include <config.hpp>
#include <events.hpp>
#include <media_library.hpp>
#include <session.hpp>
#include <state_machine.hpp>
#include <supervisor.hpp>
#include <transfer.hpp>
#include <validator.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace hplayer::controller {

    /**
     * @brief Outcome of one controller operation. The view is taken after the
     * operation settled, also on failure.
     */
    struct OpResult {
        common::ErrorCode code = common::ErrorCode::None;
        std::string message;
        session::SessionView view;

        bool ok() const { return code == common::ErrorCode::None; }
    };

    nlohmann::json to_json(const OpResult &r);

    struct HealthView {
        bool healthy = false;
        bool player_running = false;
        std::string media_dir;
        std::optional<media::DiskSpace> disk;
        std::string disk_error;
        std::string timestamp;
    };

    nlohmann::json to_json(const HealthView &h);

    /**
     * @brief Serializes every playback operation onto one worker thread.
     *
     * - Caller operations are validated on the caller's thread, then queued FIFO;
     *   at most max_pending_commands may wait, beyond that the result is Busy.
     * - A ticker posts the liveness probe and the property poll into the same queue.
     * - Player notifications are queued separately (position updates coalesced)
     *   and folded into the state machine between tasks; notifications from an
     *   older session generation are dropped.
     * - Status reads never queue: they copy the state machine snapshot.
     */
    class Controller {
    public:
        explicit Controller(config::ConfigStore &store);
        ~Controller();

        Controller(const Controller&) = delete;
        Controller& operator=(const Controller&) = delete;

        /// Launch the worker and ticker threads.
        void start();

        /// Stop the player, then the threads. Idempotent.
        void shutdown();

        /// Queue a validated command; an invalid one completes immediately with its error.
        std::future<OpResult> submit(validator::Validation v);
        std::future<OpResult> submit_delete(const std::string &name);

        OpResult play(const nlohmann::json &file);
        OpResult pause();
        OpResult resume();
        OpResult toggle_pause();
        OpResult stop();
        OpResult seek(const nlohmann::json &position);
        OpResult skip(const nlohmann::json &seconds);
        OpResult set_volume(const nlohmann::json &level);
        OpResult set_output_route(const nlohmann::json &route);
        OpResult delete_media(const std::string &name);

        session::SessionView get_status() const;
        session::Session session() const;

        common::ErrorCode list_media(std::vector<session::MediaFile> &out, std::string &err) const;
        HealthView health() const;

        nlohmann::json config() const;
        OpResult update_config(const nlohmann::json &patch);

        transfer::TransferPipeline &transfer() { return transfer_; }
        const validator::Validator &validator() const { return validator_; }

    private:
        struct Task {
            std::function<void()> fn;
            bool counted;  // caller task, subject to the pending limit
        };

        std::future<OpResult> enqueue(std::function<OpResult()> fn);
        void post_internal(std::atomic<bool> &queued, std::function<void()> fn);
        void post_event(uint64_t generation, const events::PlayerEvent &ev);

        void worker_loop();
        void ticker_loop();

        // worker-only
        OpResult execute(const validator::Command &cmd);
        OpResult do_play(const validator::Command &cmd);
        OpResult do_pause();
        OpResult do_resume();
        OpResult do_stop();
        OpResult do_seek(const validator::Command &cmd);
        OpResult do_volume(const validator::Command &cmd);
        OpResult do_output_route(const validator::Command &cmd);
        OpResult do_delete(const std::string &name);
        void handle_event(uint64_t generation, const events::PlayerEvent &ev);
        void probe();
        void refresh();
        void resync_audio();
        void teardown();
        void fail_session(const std::string &reason);
        common::ErrorCode call(const nlohmann::json &command, nlohmann::json *reply, std::string &err);
        OpResult result(common::ErrorCode code = common::ErrorCode::None, std::string message = {}) const;

        config::ConfigStore &config_;
        validator::Validator validator_;
        media::MediaLibrary media_;
        transfer::TransferPipeline transfer_;
        state::StateMachine sm_;
        supervisor::ProcessSupervisor supervisor_;

        // worker-only session bookkeeping
        uint64_t next_generation_;
        uint64_t live_generation_;
        int failures_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<Task> tasks_;
        std::deque<std::pair<uint64_t, events::PlayerEvent>> events_;
        size_t pending_;
        size_t max_pending_;
        bool running_;
        bool stop_;

        std::atomic<bool> probe_queued_;
        std::atomic<bool> poll_queued_;
        int probe_interval_ms_;
        int poll_interval_ms_;

        std::mutex ticker_mtx_;
        std::condition_variable ticker_cv_;
        bool ticker_stop_;

        std::thread worker_;
        std::thread ticker_;
    };

} // namespace hplayer::controller

#endif // HPLAYER_CONTROLLER_HPP
