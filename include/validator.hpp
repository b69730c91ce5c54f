/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_VALIDATOR_HPP
#define HPLAYER_VALIDATOR_HPP

#pragma once

#include <common.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hplayer::validator {

    enum class CommandKind : int {
        Play,
        Pause,
        Resume,
        Toggle,
        Stop,
        Seek,
        Skip,
        Volume,
        OutputRoute
    };

    const char *kind_name(CommandKind k);

    /**
     * @brief A validated, normalized operation. Only the Validator builds these.
     */
    class Command {
    public:
        CommandKind kind() const { return kind_; }
        const std::string &media() const { return media_; }   // normalized file name
        const std::string &path() const { return path_; }     // absolute path inside the media directory
        double seconds() const { return seconds_; }           // seek target or skip delta
        int volume() const { return volume_; }
        const std::string &route() const { return route_; }

    private:
        friend class Validator;
        explicit Command(CommandKind k) : kind_(k) {}

        CommandKind kind_;
        std::string media_;
        std::string path_;
        double seconds_ = 0.0;
        int volume_ = 0;
        std::string route_;
    };

    struct Validation {
        common::ErrorCode code = common::ErrorCode::None;
        std::string message;
        std::optional<Command> command;

        bool ok() const { return code == common::ErrorCode::None; }
    };

    /// Extensions accepted for playback and upload, lowercase with the dot.
    const std::vector<std::string> &allowed_extensions();

    /// Case-insensitive extension check.
    bool has_allowed_extension(const std::string &name);

    /**
     * @brief Normalize a caller supplied file name and confine it to @p media_dir.
     *
     * Leading/trailing whitespace is trimmed and inner whitespace becomes '_'.
     * Rejected: empty names, path separators, "..", control characters, a leading
     * '.', disallowed extensions and anything resolving outside @p media_dir
     * (symlinks followed).
     * @return None or InvalidFilename (with @p message)
     */
    common::ErrorCode check_filename(const std::string &media_dir, const std::string &raw,
                                     std::string &normalized, std::string &resolved, std::string &message);

    /**
     * @brief Turns raw request values into Commands.
     *
     * Numeric parameters are accepted as JSON numbers or numeric strings.
     */
    class Validator {
    public:
        explicit Validator(std::string media_dir);

        /// File must exist and be a regular file.
        Validation play(const nlohmann::json &file) const;
        Validation seek(const nlohmann::json &position) const;
        Validation skip(const nlohmann::json &seconds) const;
        Validation volume(const nlohmann::json &level) const;
        Validation output_route(const nlohmann::json &route) const;

        /// Parameterless kinds: Pause, Resume, Toggle, Stop.
        Validation simple(CommandKind kind) const;

        const std::string &media_dir() const { return media_dir_; }

    private:
        std::string media_dir_;
    };

} // namespace hplayer::validator

#endif // HPLAYER_VALIDATOR_HPP
