/*
* @license
* (C) zachbabanov
*
*/

#include <controller.hpp>
#include <logger.hpp>

#include <algorithm>
#include <chrono>

using namespace hplayer::controller;
using namespace hplayer::common;
using namespace hplayer::session;
using namespace hplayer::state;
using namespace hplayer::validator;
using namespace hplayer::events;

using json = nlohmann::json;

namespace hplayer::controller {

    json to_json(const OpResult &r) {
        json j;
        j["success"] = r.ok();
        if (!r.ok()) {
            j["error"] = r.message.empty() ? std::string(error_name(r.code)) : r.message;
            j["code"] = error_name(r.code);
        }
        j["status"] = session::to_json(r.view);
        return j;
    }

    json to_json(const HealthView &h) {
        json j;
        j["status"] = h.healthy ? "healthy" : "unhealthy";
        j["player_running"] = h.player_running;
        j["media_dir"] = h.media_dir;
        if (h.disk) {
            j["disk_space"] = media::to_json(*h.disk);
        } else {
            j["disk_space"] = json{{"error", h.disk_error}};
        }
        j["timestamp"] = h.timestamp;
        return j;
    }

    // A process is attached and the channel is expected to answer.
    static bool has_player(PlaybackState s) {
        return s == PlaybackState::Ready || s == PlaybackState::Playing || s == PlaybackState::Paused;
    }

    static supervisor::SpawnOptions spawn_options(const config::Config &cfg) {
        supervisor::SpawnOptions o;
        o.player_cmd = cfg.player_cmd;
        o.runtime_dir = cfg.runtime_dir;
        o.volume = cfg.volume;
        o.output_route = cfg.hdmi_output;
        o.hardware_accel = cfg.hardware_accel;
        o.audio_in_headless = cfg.audio_in_headless;
        o.audio_device = cfg.audio_device;
        o.loop = cfg.loop;
        o.extra_args = cfg.player_extra_args;
        return o;
    }

} // namespace hplayer::controller

Controller::Controller(config::ConfigStore &store)
    : config_(store),
      validator_(store.get().media_dir),
      media_(store.get().media_dir),
      transfer_(store.get().media_dir, store.get().max_upload_size),
      supervisor_(store.get().command_timeout_ms),
      next_generation_(1),
      live_generation_(0),
      failures_(0),
      pending_(0),
      max_pending_(16),
      running_(false),
      stop_(false),
      probe_queued_(false),
      poll_queued_(false),
      probe_interval_ms_(PROBE_INTERVAL_MS),
      poll_interval_ms_(POLL_INTERVAL_MS),
      ticker_stop_(false) {
    config::Config cfg = store.get();
    max_pending_ = (size_t)cfg.max_pending_commands;
    probe_interval_ms_ = cfg.probe_interval_ms;
    poll_interval_ms_ = cfg.poll_interval_ms;
    sm_.set_volume(cfg.volume);
    sm_.set_output_route(cfg.hdmi_output);
}

Controller::~Controller() {
    shutdown();
}

void Controller::start() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_ || stop_) return;
        running_ = true;
    }
    std::string err;
    if (!media_.ensure_directory(err)) {
        LOG_GEN_ERROR("Media directory unusable: {}", err);
    }
    worker_ = std::thread(&Controller::worker_loop, this);
    ticker_ = std::thread(&Controller::ticker_loop, this);
    LOG_PLAY_INFO("Controller started (media_dir='{}', max_pending={})", media_.dir(), max_pending_);
}

void Controller::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
    }
    {
        std::lock_guard<std::mutex> lk(ticker_mtx_);
        ticker_stop_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_.joinable()) ticker_.join();

    // last task: stop the player behind whatever is still queued
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tasks_.push_back(Task{[this, done] { teardown(); done->set_value(); }, false});
        stop_ = true;
    }
    cv_.notify_all();
    fut.wait();

    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
    }
    LOG_PLAY_INFO("Controller stopped");
}

//
// Queueing
//

std::future<OpResult> Controller::enqueue(std::function<OpResult()> fn) {
    auto task = std::make_shared<std::packaged_task<OpResult()>>(std::move(fn));
    std::future<OpResult> res = task->get_future();

    std::string refused;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_ || stop_) {
            refused = "Controller is not running";
        } else if (pending_ >= max_pending_) {
            refused = fmt::format("Too many pending commands ({})", pending_);
        } else {
            tasks_.push_back(Task{[task] { (*task)(); }, true});
            ++pending_;
        }
    }
    if (!refused.empty()) {
        LOG_PLAY_WARN("Command refused: {}", refused);
        std::promise<OpResult> p;
        p.set_value(result(ErrorCode::Busy, refused));
        return p.get_future();
    }
    cv_.notify_one();
    return res;
}

void Controller::post_internal(std::atomic<bool> &queued, std::function<void()> fn) {
    if (queued.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stop_) {
            queued = false;
            return;
        }
        tasks_.push_back(Task{[&queued, fn = std::move(fn)] {
            queued = false;
            fn();
        }, false});
    }
    cv_.notify_one();
}

void Controller::post_event(uint64_t generation, const PlayerEvent &ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        // time-pos arrives many times per second; only the newest matters
        if (std::holds_alternative<PositionChanged>(ev) && !events_.empty() &&
            events_.back().first == generation &&
            std::holds_alternative<PositionChanged>(events_.back().second)) {
            events_.back().second = ev;
        } else {
            events_.emplace_back(generation, ev);
        }
    }
    cv_.notify_one();
}

void Controller::worker_loop() {
    for (;;) {
        std::deque<std::pair<uint64_t, PlayerEvent>> evs;
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this] { return stop_ || !tasks_.empty() || !events_.empty(); });
            if (stop_ && tasks_.empty() && events_.empty()) return;
            evs.swap(events_);
            if (!tasks_.empty()) {
                task = std::move(tasks_.front().fn);
                if (tasks_.front().counted) --pending_;
                tasks_.pop_front();
            }
        }
        for (auto &e : evs) handle_event(e.first, e.second);
        if (task) task();
    }
}

void Controller::ticker_loop() {
    using clock = std::chrono::steady_clock;
    auto next_probe = clock::now() + std::chrono::milliseconds(probe_interval_ms_);
    auto next_poll = clock::now() + std::chrono::milliseconds(poll_interval_ms_);

    std::unique_lock<std::mutex> lk(ticker_mtx_);
    while (!ticker_stop_) {
        auto wake = std::min(next_probe, next_poll);
        ticker_cv_.wait_until(lk, wake, [this] { return ticker_stop_; });
        if (ticker_stop_) break;

        auto now = clock::now();
        if (now >= next_probe) {
            post_internal(probe_queued_, [this] { probe(); });
            next_probe = now + std::chrono::milliseconds(probe_interval_ms_);
        }
        if (now >= next_poll) {
            post_internal(poll_queued_, [this] { refresh(); });
            next_poll = now + std::chrono::milliseconds(poll_interval_ms_);
        }
    }
}

//
// Public operations
//

std::future<OpResult> Controller::submit(Validation v) {
    if (!v.ok()) {
        std::promise<OpResult> p;
        p.set_value(result(v.code, v.message));
        return p.get_future();
    }
    Command cmd = *v.command;
    return enqueue([this, cmd] { return execute(cmd); });
}

std::future<OpResult> Controller::submit_delete(const std::string &name) {
    return enqueue([this, name] { return do_delete(name); });
}

OpResult Controller::play(const json &file) { return submit(validator_.play(file)).get(); }
OpResult Controller::pause() { return submit(validator_.simple(CommandKind::Pause)).get(); }
OpResult Controller::resume() { return submit(validator_.simple(CommandKind::Resume)).get(); }
OpResult Controller::toggle_pause() { return submit(validator_.simple(CommandKind::Toggle)).get(); }
OpResult Controller::stop() { return submit(validator_.simple(CommandKind::Stop)).get(); }
OpResult Controller::seek(const json &position) { return submit(validator_.seek(position)).get(); }
OpResult Controller::skip(const json &seconds) { return submit(validator_.skip(seconds)).get(); }
OpResult Controller::set_volume(const json &level) { return submit(validator_.volume(level)).get(); }
OpResult Controller::set_output_route(const json &route) { return submit(validator_.output_route(route)).get(); }
OpResult Controller::delete_media(const std::string &name) { return submit_delete(name).get(); }

SessionView Controller::get_status() const {
    return sm_.view();
}

Session Controller::session() const {
    return sm_.snapshot();
}

ErrorCode Controller::list_media(std::vector<MediaFile> &out, std::string &err) const {
    return media_.list(out, err);
}

HealthView Controller::health() const {
    HealthView h;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        h.healthy = running_ && !stop_;
    }
    Session s = sm_.snapshot();
    h.player_running = s.pid > 0;
    h.media_dir = media_.dir();
    media::DiskSpace d;
    if (media_.disk_space(d, h.disk_error) == ErrorCode::None) h.disk = d;
    h.timestamp = iso_time_now();
    return h;
}

json Controller::config() const {
    return config::to_json(config_.get());
}

OpResult Controller::update_config(const json &patch) {
    const config::Config before = config_.get();
    std::string err;
    ErrorCode ec = config_.update(patch, err);
    if (ec != ErrorCode::None) return result(ec, err);
    const config::Config after = config_.get();
    if (after.log_level != before.log_level) {
        log::Level lvl;
        if (log::parse_level(after.log_level, lvl)) log::Logger::instance().set_level(lvl);
    }
    if (after.max_upload_size != before.max_upload_size) {
        transfer_.set_max_upload_size(after.max_upload_size);
    }
    if (after.media_dir != before.media_dir || after.port != before.port) {
        LOG_GEN_WARN("media_dir/port changes take effect after restart");
    }
    return result();
}

//
// Worker side
//

OpResult Controller::result(ErrorCode code, std::string message) const {
    OpResult r;
    r.code = code;
    r.message = std::move(message);
    r.view = sm_.view();
    return r;
}

OpResult Controller::execute(const Command &cmd) {
    LOG_PLAY_DEBUG("Dispatch {}", kind_name(cmd.kind()));
    PlaybackState s = sm_.state();
    switch (cmd.kind()) {
        case CommandKind::Play:        return do_play(cmd);
        case CommandKind::Stop:        return do_stop();
        case CommandKind::OutputRoute: return do_output_route(cmd);
        default:
            break;
    }

    if (!is_active(s)) {
        return result(ErrorCode::NoActiveSession, "No active playback");
    }
    switch (cmd.kind()) {
        case CommandKind::Pause:  return do_pause();
        case CommandKind::Resume: return do_resume();
        case CommandKind::Toggle: return s == PlaybackState::Paused ? do_resume() : do_pause();
        case CommandKind::Seek:
        case CommandKind::Skip:   return do_seek(cmd);
        case CommandKind::Volume: return do_volume(cmd);
        default:
            break;
    }
    return result(ErrorCode::ValidationError, fmt::format("Unsupported command '{}'", kind_name(cmd.kind())));
}

OpResult Controller::do_play(const Command &cmd) {
    PlaybackState s = sm_.state();
    if (s == PlaybackState::Failed) {
        live_generation_ = 0;
        supervisor_.stop(false);
    } else if (s != PlaybackState::Idle) {
        teardown();
    }

    const config::Config cfg = config_.get();
    const uint64_t gen = next_generation_++;
    supervisor_.channel().observe([this, gen](const PlayerEvent &ev) { post_event(gen, ev); });

    sm_.apply(Trigger::Start);
    sm_.set_volume(cfg.volume);
    sm_.set_output_route(cfg.hdmi_output);

    supervisor::SessionInfo info;
    std::string err;
    ErrorCode ec = supervisor_.start(gen, cmd.path(), spawn_options(cfg), info, err);
    if (ec != ErrorCode::None) {
        sm_.apply(Trigger::StartFailed, err);
        return result(ec, err);
    }
    sm_.attach_process(info.generation, info.pid, info.endpoint, info.created_at);
    live_generation_ = gen;
    failures_ = 0;
    sm_.apply(Trigger::ChannelReady);

    static const std::pair<int, const char*> observed[] = {
            {OBSERVE_TIME_POS, "time-pos"},
            {OBSERVE_PAUSE,    "pause"},
            {OBSERVE_DURATION, "duration"},
            {OBSERVE_VOLUME,   "volume"},
            {OBSERVE_EOF,      "eof-reached"},
    };
    for (const auto &o : observed) {
        ec = call(json::array({"observe_property", o.first, o.second}), nullptr, err);
        if (ec != ErrorCode::None) {
            LOG_PLAY_WARN("observe_property {} failed: {}", o.second, err);
            if (sm_.state() == PlaybackState::Failed) return result(ec, err);
        }
    }

    ec = call(json::array({"set_property", "pause", false}), nullptr, err);
    if (ec != ErrorCode::None) {
        if (sm_.state() == PlaybackState::Failed) return result(ec, err);
        LOG_PLAY_WARN("Could not unpause after load: {}", err);
    }

    sm_.apply(Trigger::Play, cmd.media());
    refresh();
    LOG_PLAY_INFO("Playing '{}' (session {})", cmd.media(), gen);
    return result();
}

OpResult Controller::do_pause() {
    if (sm_.state() == PlaybackState::Paused) return result();
    std::string err;
    ErrorCode ec = call(json::array({"set_property", "pause", true}), nullptr, err);
    if (ec != ErrorCode::None) return result(ec, err);
    sm_.apply(Trigger::Pause);
    return result();
}

OpResult Controller::do_resume() {
    if (sm_.state() == PlaybackState::Playing) return result();
    std::string err;
    ErrorCode ec = call(json::array({"set_property", "pause", false}), nullptr, err);
    if (ec != ErrorCode::None) return result(ec, err);
    sm_.apply(Trigger::Resume);
    return result();
}

OpResult Controller::do_stop() {
    teardown();
    return result();
}

OpResult Controller::do_seek(const Command &cmd) {
    const bool absolute = cmd.kind() == CommandKind::Seek;
    if (!absolute && cmd.seconds() == 0.0) return result();

    std::string err;
    ErrorCode ec = call(json::array({"seek", cmd.seconds(), absolute ? "absolute" : "relative"}), nullptr, err);
    if (ec != ErrorCode::None) return result(ec, err);

    resync_audio();
    json pos;
    if (call(json::array({"get_property", "time-pos"}), &pos, err) == ErrorCode::None && pos.is_number()) {
        sm_.update_progress(pos.get<double>(), std::nullopt, std::nullopt);
    }
    return result();
}

OpResult Controller::do_volume(const Command &cmd) {
    std::string err;
    ErrorCode ec = call(json::array({"set_property", "volume", cmd.volume()}), nullptr, err);
    if (ec != ErrorCode::None) return result(ec, err);
    sm_.set_volume(cmd.volume());
    config_.set_volume(cmd.volume());
    return result();
}

OpResult Controller::do_output_route(const Command &cmd) {
    const Session before = sm_.snapshot();
    sm_.set_output_route(cmd.route());
    config_.set_output_route(cmd.route());

    if (!before.media || !has_player(before.state) || before.output_route == cmd.route()) {
        LOG_PLAY_INFO("Output route set to {}", cmd.route());
        return result();
    }

    // the connector is bound at spawn time: restart on the new route and go back to where we were
    LOG_PLAY_INFO("Output route {} -> {}, restarting '{}' at {:.1f}s",
                  before.output_route, cmd.route(), *before.media, before.position);
    Validation v = validator_.play(*before.media);
    if (!v.ok()) {
        teardown();
        return result(v.code, v.message);
    }
    OpResult r = do_play(*v.command);
    if (!r.ok()) return r;

    std::string err;
    if (before.position > 0.0) {
        if (call(json::array({"seek", before.position, "absolute"}), nullptr, err) == ErrorCode::None) {
            sm_.update_progress(before.position, std::nullopt, std::nullopt);
        } else {
            LOG_PLAY_WARN("Could not restore position {:.1f}s: {}", before.position, err);
        }
    }
    if (before.state == PlaybackState::Paused) return do_pause();
    return result();
}

OpResult Controller::do_delete(const std::string &name) {
    std::string normalized, resolved, err;
    ErrorCode ec = check_filename(media_.dir(), name, normalized, resolved, err);
    if (ec != ErrorCode::None) return result(ec, err);

    const Session s = sm_.snapshot();
    if (s.media && *s.media == normalized && s.state != PlaybackState::Idle) {
        LOG_PLAY_INFO("'{}' is loaded, stopping before delete", normalized);
        teardown();
    }
    ec = media_.remove(name, normalized, err);
    return result(ec, err);
}

void Controller::handle_event(uint64_t generation, const PlayerEvent &ev) {
    if (generation != live_generation_) {
        LOG_PLAY_TRACE("Dropped stale event from session {}: {}", generation, describe(ev));
        return;
    }
    if (std::holds_alternative<ChannelLost>(ev)) {
        probe();
        if (live_generation_ == generation) {
            fail_session("control channel lost");
        }
        return;
    }
    sm_.on_event(ev);
}

void Controller::probe() {
    std::string reason;
    if (!supervisor_.probe(reason)) return;
    live_generation_ = 0;
    failures_ = 0;
    if (sm_.state() == PlaybackState::Stopping) {
        sm_.apply(Trigger::ProcessExited);
    } else {
        sm_.apply(Trigger::ProcessDied, "player " + reason);
    }
}

void Controller::refresh() {
    if (!has_player(sm_.state()) || !supervisor_.channel().is_connected()) return;

    std::optional<double> pos, dur;
    std::optional<int> vol;
    json v;
    std::string err;
    if (call(json::array({"get_property", "time-pos"}), &v, err) == ErrorCode::None && v.is_number()) {
        pos = v.get<double>();
    }
    if (!has_player(sm_.state())) return;
    if (call(json::array({"get_property", "duration"}), &v, err) == ErrorCode::None && v.is_number()) {
        dur = v.get<double>();
    }
    if (!has_player(sm_.state())) return;
    if (call(json::array({"get_property", "volume"}), &v, err) == ErrorCode::None && v.is_number()) {
        vol = (int)(v.get<double>() + 0.5);
    }
    sm_.update_progress(pos, dur, vol);
}

void Controller::resync_audio() {
    std::string err;
    if (call(json::array({"ao-reload"}), nullptr, err) != ErrorCode::None) {
        LOG_PLAY_WARN("Audio resync after seek failed: {}", err);
    }
}

void Controller::teardown() {
    const PlaybackState s = sm_.state();
    live_generation_ = 0;
    failures_ = 0;
    switch (s) {
        case PlaybackState::Idle:
            return;
        case PlaybackState::Failed:
            supervisor_.stop(false);
            sm_.apply(Trigger::Reset);
            return;
        case PlaybackState::Stopping:
            break;
        default:
            sm_.apply(Trigger::Stop);
            break;
    }
    supervisor_.stop(true);
    sm_.apply(Trigger::ProcessExited);
}

void Controller::fail_session(const std::string &reason) {
    LOG_PLAY_ERROR("Session failed: {}", reason);
    live_generation_ = 0;
    failures_ = 0;
    supervisor_.stop(false);
    sm_.apply(Trigger::ProcessDied, reason);
}

ErrorCode Controller::call(const json &command, json *reply, std::string &err) {
    json r;
    ErrorCode ec = supervisor_.channel().send(command, r);
    if (ec == ErrorCode::None) {
        failures_ = 0;
        if (reply) *reply = r.contains("data") ? r["data"] : json(nullptr);
        return ec;
    }

    if (ec == ErrorCode::CommandRejected) {
        auto e = r.find("error");
        err = fmt::format("player rejected {}: {}", command.dump(),
                          (e != r.end() && e->is_string()) ? e->get<std::string>() : r.dump());
    } else {
        err = fmt::format("{} while sending {}", error_name(ec), command.dump());
    }
    LOG_PLAY_DEBUG("{}", err);

    if (is_transient_channel_error(ec) && has_player(sm_.state())) {
        if (++failures_ >= MAX_CHANNEL_FAILURES) {
            fail_session(fmt::format("player unresponsive ({} consecutive channel failures)", failures_));
        }
    }
    return ec;
}
