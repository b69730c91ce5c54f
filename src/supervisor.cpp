/*
* @license
* (C) zachbabanov
*
*/

#include <supervisor.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#include <unistd.h>

#include <fmt/core.h>

using namespace hplayer::supervisor;
using namespace hplayer::common;
using namespace hplayer::player;

using json = nlohmann::json;

namespace hplayer::supervisor {

    std::vector<std::string> build_player_args(const SpawnOptions &opts, const std::string &socket_path,
                                               const std::string &media_path, const std::string &audio_device) {
        std::vector<std::string> args = {
                "--no-terminal",
                "--really-quiet",
                "--input-ipc-server=" + socket_path,
                "--idle=yes",
                "--force-window=no",
                "--keep-open=yes",
                "--volume=" + std::to_string(opts.volume),
                "--vo=gpu",
                "--gpu-context=drm",
        };
        if (opts.output_route != "auto") {
            args.push_back("--drm-connector=" + opts.output_route);
        }
        if (opts.hardware_accel) {
            args.emplace_back("--hwdec=auto");
            args.emplace_back("--hwdec-codecs=all");
        }
        if (!audio_device.empty()) {
            args.push_back("--audio-device=" + audio_device);
        }
        if (opts.loop) {
            args.emplace_back("--loop-file=inf");
        }
        // limited range output, frame timing locked to the display refresh
        args.emplace_back("--video-output-levels=limited");
        args.emplace_back("--video-sync=display-resample");
        for (const auto &a : opts.extra_args) args.push_back(a);
        // media path last, after "--" so names starting with '-' are never options
        args.emplace_back("--");
        args.push_back(media_path);
        return args;
    }

    std::string detect_hdmi_audio() {
        FILE *pipe = popen("aplay -L 2>/dev/null", "r");
        if (!pipe) {
            LOG_PROC_WARN("Could not run aplay to detect HDMI audio");
            return {};
        }
        std::string found;
        char line[512];
        while (fgets(line, sizeof(line), pipe)) {
            // device names start in column 0, descriptions are indented
            if (line[0] == ' ' || line[0] == '\t' || line[0] == '\n') continue;
            std::string name(line);
            while (!name.empty() && std::isspace((unsigned char)name.back())) name.pop_back();
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            if (found.empty() && lower.find("hdmi") != std::string::npos) {
                found = name;
            }
        }
        int rc = pclose(pipe);
        if (rc != 0 && found.empty()) {
            LOG_PROC_WARN("aplay -L failed (status {}), leaving audio device to the player", rc);
            return {};
        }
        if (found.empty()) return "alsa/default";
        return "alsa/" + found;
    }

    std::string make_endpoint(const std::string &runtime_dir, uint64_t generation) {
        return fmt::format("{}/hplayer-{}-{}.sock", runtime_dir, (int)getpid(), generation);
    }

} // namespace hplayer::supervisor

ProcessSupervisor::ProcessSupervisor(int reply_timeout_ms)
    : channel_(reply_timeout_ms) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop(false);
}

ErrorCode ProcessSupervisor::start(uint64_t generation, const std::string &media_path, const SpawnOptions &opts,
                                   SessionInfo &info, std::string &error) {
    if (process_) stop(true);

    endpoint_ = make_endpoint(opts.runtime_dir, generation);
    ::unlink(endpoint_.c_str());

    std::string audio_device;
    if (opts.audio_in_headless) {
        if (opts.audio_device == "auto") {
            if (!audio_device_cache_) audio_device_cache_ = detect_hdmi_audio();
            audio_device = *audio_device_cache_;
        } else {
            audio_device = opts.audio_device;
        }
    }

    auto args = build_player_args(opts, endpoint_, media_path, audio_device);
    process_ = PlayerProcess::launch(opts.player_cmd, args, error);
    if (!process_) {
        endpoint_.clear();
        return ErrorCode::SpawnError;
    }

    PlayerProcess *proc = process_.get();
    ErrorCode ec = channel_.connect(endpoint_, true, opts.connect_attempts, opts.connect_wait_ms,
                                    [proc] { return !proc->poll_exit(); });
    if (ec != ErrorCode::None) {
        if (proc->has_exited()) {
            error = "player exited during startup: " + proc->describe_exit();
            ec = ErrorCode::SpawnError;
        } else {
            error = fmt::format("player socket '{}' not ready after {} ms", endpoint_, opts.connect_wait_ms);
        }
        LOG_PROC_ERROR("Start failed: {}", error);
        proc->terminate(TERM_GRACE_MS);
        release();
        return ec;
    }

    info.generation = generation;
    info.pid = proc->pid();
    info.endpoint = endpoint_;
    info.created_at = (int64_t)std::time(nullptr);
    LOG_PROC_INFO("Session {} ready: pid={} endpoint='{}'", generation, (int)info.pid, info.endpoint);
    return ErrorCode::None;
}

void ProcessSupervisor::stop(bool graceful) {
    if (!process_) {
        release();
        return;
    }

    if (graceful && channel_.is_connected() && !process_->poll_exit()) {
        ErrorCode ec = channel_.send(json::array({"quit"}));
        if (ec != ErrorCode::None && ec != ErrorCode::ChannelClosed) {
            LOG_PROC_DEBUG("quit not acknowledged: {}", error_name(ec));
        }
        if (process_->wait_for_exit(GRACEFUL_QUIT_TIMEOUT_MS)) {
            LOG_PROC_INFO("Player pid={} quit gracefully", (int)process_->pid());
        } else {
            LOG_PROC_WARN("Player pid={} ignored quit for {} ms", (int)process_->pid(), GRACEFUL_QUIT_TIMEOUT_MS);
        }
    }
    process_->terminate(TERM_GRACE_MS);
    release();
}

bool ProcessSupervisor::probe(std::string &reason) {
    if (!process_) return false;
    if (!process_->poll_exit()) return false;
    reason = "process exited (" + process_->describe_exit() + ")";
    LOG_PROC_WARN("Player pid={} {}", (int)process_->pid(), reason);
    release();
    return true;
}

pid_t ProcessSupervisor::pid() const {
    return process_ ? process_->pid() : -1;
}

void ProcessSupervisor::release() {
    channel_.close();
    if (!endpoint_.empty()) {
        ::unlink(endpoint_.c_str());
        endpoint_.clear();
    }
    process_.reset();
}
