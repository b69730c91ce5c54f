/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <sys/stat.h>

using json = nlohmann::json;

namespace hplayer::config {

    static std::string home_dir() {
        const char *h = std::getenv("HOME");
        if (h && h[0] != '\0') return std::string(h);
        return ".";
    }

    static bool file_exists(const std::string &path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    /**
     * @brief Copy j[key] into out when present; a type mismatch is reported and skipped.
     */
    template<typename T>
    static void read_key(const json &j, const char *key, T &out, std::vector<std::string> &warnings) {
        if (!j.contains(key)) return;
        try {
            out = j.at(key).get<T>();
        } catch (const json::exception &e) {
            warnings.push_back(fmt::format("config key '{}' has wrong type: {}", key, e.what()));
        }
    }

    const std::vector<std::string> &allowed_output_routes() {
        static const std::vector<std::string> routes = {"auto", "HDMI-A-1", "HDMI-A-2"};
        return routes;
    }

    Config default_config() {
        Config c;
        c.media_dir = home_dir() + "/videos";
        return c;
    }

    std::string default_config_path() {
        return home_dir() + "/headless-mpv-config.json";
    }

    json to_json(const Config &cfg) {
        json j;
        j["media_dir"] = cfg.media_dir;
        j["max_upload_size"] = cfg.max_upload_size;
        j["volume"] = cfg.volume;
        j["loop"] = cfg.loop;
        j["hardware_accel"] = cfg.hardware_accel;
        j["hdmi_output"] = cfg.hdmi_output;
        j["audio_in_headless"] = cfg.audio_in_headless;
        j["audio_device"] = cfg.audio_device;
        j["port"] = cfg.port;
        j["log_level"] = cfg.log_level;
        j["log_file"] = cfg.log_file;
        j["player_cmd"] = cfg.player_cmd;
        j["player_extra_args"] = cfg.player_extra_args;
        j["runtime_dir"] = cfg.runtime_dir;
        j["poll_interval_ms"] = cfg.poll_interval_ms;
        j["probe_interval_ms"] = cfg.probe_interval_ms;
        j["command_timeout_ms"] = cfg.command_timeout_ms;
        j["max_pending_commands"] = cfg.max_pending_commands;
        return j;
    }

    void merge_json(const json &j, Config &cfg, std::vector<std::string> &warnings) {
        if (!j.is_object()) {
            warnings.emplace_back("config root is not a JSON object");
            return;
        }
        read_key(j, "media_dir", cfg.media_dir, warnings);
        read_key(j, "max_upload_size", cfg.max_upload_size, warnings);
        read_key(j, "volume", cfg.volume, warnings);
        read_key(j, "loop", cfg.loop, warnings);
        read_key(j, "hardware_accel", cfg.hardware_accel, warnings);
        read_key(j, "hdmi_output", cfg.hdmi_output, warnings);
        read_key(j, "audio_in_headless", cfg.audio_in_headless, warnings);
        read_key(j, "audio_device", cfg.audio_device, warnings);
        read_key(j, "port", cfg.port, warnings);
        read_key(j, "log_level", cfg.log_level, warnings);
        read_key(j, "log_file", cfg.log_file, warnings);
        read_key(j, "player_cmd", cfg.player_cmd, warnings);
        read_key(j, "player_extra_args", cfg.player_extra_args, warnings);
        read_key(j, "runtime_dir", cfg.runtime_dir, warnings);
        read_key(j, "poll_interval_ms", cfg.poll_interval_ms, warnings);
        read_key(j, "probe_interval_ms", cfg.probe_interval_ms, warnings);
        read_key(j, "command_timeout_ms", cfg.command_timeout_ms, warnings);
        read_key(j, "max_pending_commands", cfg.max_pending_commands, warnings);
    }

    // Checks every field; when fix is set invalid fields are reset to their defaults.
    static std::vector<std::string> check(Config &cfg, bool fix) {
        std::vector<std::string> errors;
        const Config def = default_config();

        if (cfg.media_dir.empty()) {
            errors.emplace_back("media_dir must not be empty");
            if (fix) cfg.media_dir = def.media_dir;
        }
        if (cfg.max_upload_size == 0) {
            errors.emplace_back("max_upload_size must be positive");
            if (fix) cfg.max_upload_size = def.max_upload_size;
        }
        if (cfg.volume < common::VOLUME_MIN || cfg.volume > common::VOLUME_MAX) {
            errors.push_back(fmt::format("volume must be between {} and {}, got {}",
                                         common::VOLUME_MIN, common::VOLUME_MAX, cfg.volume));
            if (fix) cfg.volume = def.volume;
        }
        const auto &routes = allowed_output_routes();
        if (std::find(routes.begin(), routes.end(), cfg.hdmi_output) == routes.end()) {
            errors.push_back(fmt::format("invalid hdmi_output '{}'", cfg.hdmi_output));
            if (fix) cfg.hdmi_output = def.hdmi_output;
        }
        if (cfg.port <= 0 || cfg.port > 65535) {
            errors.push_back(fmt::format("port out of range: {}", cfg.port));
            if (fix) cfg.port = def.port;
        }
        log::Level lvl;
        if (!log::parse_level(cfg.log_level, lvl)) {
            errors.push_back(fmt::format("unknown log_level '{}'", cfg.log_level));
            if (fix) cfg.log_level = def.log_level;
        }
        if (cfg.player_cmd.empty()) {
            errors.emplace_back("player_cmd must not be empty");
            if (fix) cfg.player_cmd = def.player_cmd;
        }
        if (cfg.runtime_dir.empty()) {
            errors.emplace_back("runtime_dir must not be empty");
            if (fix) cfg.runtime_dir = def.runtime_dir;
        }
        if (cfg.poll_interval_ms <= 0) {
            errors.push_back(fmt::format("poll_interval_ms must be positive, got {}", cfg.poll_interval_ms));
            if (fix) cfg.poll_interval_ms = def.poll_interval_ms;
        }
        if (cfg.probe_interval_ms <= 0) {
            errors.push_back(fmt::format("probe_interval_ms must be positive, got {}", cfg.probe_interval_ms));
            if (fix) cfg.probe_interval_ms = def.probe_interval_ms;
        }
        if (cfg.command_timeout_ms <= 0) {
            errors.push_back(fmt::format("command_timeout_ms must be positive, got {}", cfg.command_timeout_ms));
            if (fix) cfg.command_timeout_ms = def.command_timeout_ms;
        }
        if (cfg.max_pending_commands <= 0) {
            errors.push_back(fmt::format("max_pending_commands must be positive, got {}", cfg.max_pending_commands));
            if (fix) cfg.max_pending_commands = def.max_pending_commands;
        }
        return errors;
    }

    std::vector<std::string> validate_config(const Config &cfg) {
        Config copy = cfg;
        return check(copy, false);
    }

    void sanitize_config(Config &cfg, std::vector<std::string> &warnings) {
        auto errors = check(cfg, true);
        for (auto &e : errors) warnings.push_back(e + " (using default)");
    }

    bool load_config(const std::string &path, Config &out, std::vector<std::string> &warnings, std::string &err) {
        out = default_config();
        if (!file_exists(path)) {
            LOG_GEN_INFO("No config file at '{}', creating default", path);
            std::string save_err;
            if (!save_config(path, out, save_err)) {
                warnings.push_back(save_err);
            }
            return true;
        }

        std::ifstream ifs(path);
        if (!ifs) {
            err = fmt::format("cannot open config file '{}'", path);
            return false;
        }
        try {
            json j;
            ifs >> j;
            merge_json(j, out, warnings);
        } catch (const json::exception &e) {
            err = fmt::format("error parsing config '{}': {}", path, e.what());
            out = default_config();
            return false;
        }
        sanitize_config(out, warnings);
        LOG_GEN_INFO("Configuration loaded from '{}'", path);
        return true;
    }

    bool save_config(const std::string &path, const Config &cfg, std::string &err) {
        std::ofstream ofs(path, std::ios::out | std::ios::trunc);
        if (!ofs) {
            err = fmt::format("cannot write config file '{}'", path);
            return false;
        }
        ofs << to_json(cfg).dump(2) << "\n";
        if (!ofs) {
            err = fmt::format("write to config file '{}' failed", path);
            return false;
        }
        return true;
    }

    ConfigStore::ConfigStore(std::string path, Config initial)
        : path_(std::move(path)), cfg_(std::move(initial)) {}

    Config ConfigStore::get() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return cfg_;
    }

    bool ConfigStore::persist_locked(std::string &err) {
        if (path_.empty()) return true;
        return save_config(path_, cfg_, err);
    }

    common::ErrorCode ConfigStore::update(const json &patch, std::string &err) {
        if (!patch.is_object() || patch.empty()) {
            err = "No configuration data provided";
            return common::ErrorCode::ValidationError;
        }
        std::lock_guard<std::mutex> lk(mtx_);
        Config next = cfg_;
        std::vector<std::string> warnings;
        merge_json(patch, next, warnings);
        if (!warnings.empty()) {
            err = warnings.front();
            return common::ErrorCode::ValidationError;
        }
        auto errors = validate_config(next);
        if (!errors.empty()) {
            err = errors.front();
            return common::ErrorCode::ValidationError;
        }
        Config prev = cfg_;
        cfg_ = next;
        if (!persist_locked(err)) {
            cfg_ = prev;
            LOG_GEN_ERROR("Configuration not updated: {}", err);
            return common::ErrorCode::IoError;
        }
        LOG_GEN_INFO("Configuration updated ({} keys)", patch.size());
        return common::ErrorCode::None;
    }

    bool ConfigStore::set_volume(int volume) {
        std::lock_guard<std::mutex> lk(mtx_);
        cfg_.volume = volume;
        std::string err;
        if (!persist_locked(err)) {
            LOG_GEN_WARN("Could not persist volume: {}", err);
            return false;
        }
        return true;
    }

    bool ConfigStore::set_output_route(const std::string &route) {
        std::lock_guard<std::mutex> lk(mtx_);
        cfg_.hdmi_output = route;
        std::string err;
        if (!persist_locked(err)) {
            LOG_GEN_WARN("Could not persist output route: {}", err);
            return false;
        }
        return true;
    }

} // namespace hplayer::config
