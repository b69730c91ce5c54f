/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_CONFIG_HPP
#define HPLAYER_CONFIG_HPP

#pragma once

#include <common.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hplayer::config {

    /**
     * @brief Controller settings, read from a single JSON file at startup.
     *
     * Unknown keys in the file are ignored; keys of the wrong type or with
     * out-of-range values fall back to the defaults below.
     */
    struct Config {
        std::string media_dir;
        uint64_t max_upload_size = common::DEFAULT_MAX_UPLOAD;
        int volume = 100;
        bool loop = false;
        bool hardware_accel = true;
        std::string hdmi_output = "auto";
        bool audio_in_headless = true;
        std::string audio_device = "auto";   // "auto" = detect HDMI sink via aplay -L
        int port = 5000;
        std::string log_level = "info";
        std::string log_file;
        std::string player_cmd = "mpv";
        std::vector<std::string> player_extra_args;
        std::string runtime_dir = "/tmp";    // where per-session IPC sockets live
        int poll_interval_ms = common::POLL_INTERVAL_MS;
        int probe_interval_ms = common::PROBE_INTERVAL_MS;
        int command_timeout_ms = common::CHANNEL_REPLY_TIMEOUT_MS;
        int max_pending_commands = 16;
    };

    /// Output routes the player may be bound to.
    const std::vector<std::string> &allowed_output_routes();

    /// Defaults with media_dir = $HOME/videos.
    Config default_config();

    /// $HOME/headless-mpv-config.json
    std::string default_config_path();

    nlohmann::json to_json(const Config &cfg);

    /**
     * @brief Merge the keys present in @p j into @p cfg.
     * Keys with the wrong JSON type are skipped and reported in @p warnings.
     */
    void merge_json(const nlohmann::json &j, Config &cfg, std::vector<std::string> &warnings);

    /// Returns a list of error messages. Empty = valid.
    std::vector<std::string> validate_config(const Config &cfg);

    /// Replace every invalid field by its default; messages for replaced fields go to @p warnings.
    void sanitize_config(Config &cfg, std::vector<std::string> &warnings);

    /**
     * @brief Load configuration from @p path.
     *
     * A missing file is created with the defaults. A file that cannot be parsed
     * leaves the defaults in place and returns false with @p err set.
     */
    bool load_config(const std::string &path, Config &out, std::vector<std::string> &warnings, std::string &err);

    bool save_config(const std::string &path, const Config &cfg, std::string &err);

    /**
     * @brief Thread-safe holder for the live configuration.
     *
     * Changes made through it are written back to the file it was loaded from
     * (nothing is written when the path is empty).
     */
    class ConfigStore {
    public:
        ConfigStore(std::string path, Config initial);

        Config get() const;
        const std::string &path() const { return path_; }

        /// Apply a partial JSON update. Invalid or unwritable updates leave the store unchanged.
        common::ErrorCode update(const nlohmann::json &patch, std::string &err);

        bool set_volume(int volume);
        bool set_output_route(const std::string &route);

    private:
        bool persist_locked(std::string &err);

        mutable std::mutex mtx_;
        std::string path_;
        Config cfg_;
    };

} // namespace hplayer::config

#endif // HPLAYER_CONFIG_HPP
