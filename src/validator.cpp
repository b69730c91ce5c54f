/*
* @license
* (C) zachbabanov
*
*/

#include <validator.hpp>
#include <config.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>

using namespace hplayer::validator;
using namespace hplayer::common;

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace hplayer::validator {

    const char *kind_name(CommandKind k) {
        switch (k) {
            case CommandKind::Play:        return "play";
            case CommandKind::Pause:       return "pause";
            case CommandKind::Resume:      return "resume";
            case CommandKind::Toggle:      return "toggle";
            case CommandKind::Stop:        return "stop";
            case CommandKind::Seek:        return "seek";
            case CommandKind::Skip:        return "skip";
            case CommandKind::Volume:      return "volume";
            case CommandKind::OutputRoute: return "output";
        }
        return "unknown";
    }

    const std::vector<std::string> &allowed_extensions() {
        static const std::vector<std::string> exts = {
                ".mp4", ".avi", ".mkv", ".mov", ".wmv", ".flv",
                ".webm", ".m4v", ".mpg", ".mpeg", ".3gp", ".ogv"
        };
        return exts;
    }

    static std::string lower_extension(const std::string &name) {
        auto dot = name.find_last_of('.');
        if (dot == std::string::npos || dot == 0) return {};
        std::string ext = name.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return ext;
    }

    bool has_allowed_extension(const std::string &name) {
        std::string ext = lower_extension(name);
        if (ext.empty()) return false;
        const auto &exts = allowed_extensions();
        return std::find(exts.begin(), exts.end(), ext) != exts.end();
    }

    static std::string trim(const std::string &s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    ErrorCode check_filename(const std::string &media_dir, const std::string &raw,
                             std::string &normalized, std::string &resolved, std::string &message) {
        std::string name = trim(raw);
        if (name.empty()) {
            message = "Filename cannot be empty";
            return ErrorCode::InvalidFilename;
        }

        for (char &c : name) {
            unsigned char uc = (unsigned char)c;
            if (uc < 0x20 || uc == 0x7f) {
                message = fmt::format("Invalid filename: control character in '{}'", raw);
                return ErrorCode::InvalidFilename;
            }
            if (c == ' ' || c == '\t') c = '_';
        }

        if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
            name.find("..") != std::string::npos) {
            message = "Path traversal attempt detected";
            return ErrorCode::InvalidFilename;
        }
        if (name[0] == '.') {
            message = fmt::format("Invalid filename: {}", raw);
            return ErrorCode::InvalidFilename;
        }
        if (!has_allowed_extension(name)) {
            std::string ext = lower_extension(name);
            std::string list;
            for (const auto &e : allowed_extensions()) {
                if (!list.empty()) list += ", ";
                list += e;
            }
            message = fmt::format("File type {} not allowed. Allowed types: {}",
                                  ext.empty() ? std::string("(none)") : ext, list);
            return ErrorCode::InvalidFilename;
        }

        std::error_code ec;
        fs::path root = fs::weakly_canonical(fs::path(media_dir), ec);
        if (ec) {
            message = fmt::format("Media directory unavailable: {}", ec.message());
            return ErrorCode::InvalidFilename;
        }
        fs::path full = fs::weakly_canonical(root / name, ec);
        if (ec || full.parent_path() != root) {
            // also catches a symlink inside the directory pointing elsewhere
            message = "Path traversal attempt detected";
            return ErrorCode::InvalidFilename;
        }

        normalized = name;
        resolved = full.string();
        return ErrorCode::None;
    }

    // JSON number or numeric string. @p text receives the value as the caller wrote it.
    static bool to_number(const json &v, double &out, std::string &text) {
        if (v.is_string()) {
            text = v.get<std::string>();
            std::string s = trim(text);
            if (s.empty()) return false;
            errno = 0;
            char *end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (errno == ERANGE || end != s.c_str() + s.size()) return false;
            if (!std::isfinite(d)) return false;
            out = d;
            return true;
        }
        text = v.is_null() ? std::string("null") : v.dump();
        if (!v.is_number()) return false;
        double d = v.get<double>();
        if (!std::isfinite(d)) return false;
        out = d;
        return true;
    }

    static Validation fail(ErrorCode code, std::string message) {
        Validation v;
        v.code = code;
        v.message = std::move(message);
        LOG_PLAY_DEBUG("Rejected: {}", v.message);
        return v;
    }

} // namespace hplayer::validator

Validator::Validator(std::string media_dir)
    : media_dir_(std::move(media_dir)) {}

Validation Validator::play(const json &file) const {
    if (!file.is_string()) {
        return fail(ErrorCode::InvalidFilename, "Filename cannot be empty");
    }
    std::string normalized, resolved, message;
    ErrorCode ec = check_filename(media_dir_, file.get<std::string>(), normalized, resolved, message);
    if (ec != ErrorCode::None) return fail(ec, message);

    std::error_code fec;
    if (!fs::is_regular_file(resolved, fec)) {
        return fail(ErrorCode::ValidationError, fmt::format("File not found: {}", normalized));
    }

    Command cmd(CommandKind::Play);
    cmd.media_ = normalized;
    cmd.path_ = resolved;
    Validation v;
    v.command = cmd;
    return v;
}

Validation Validator::seek(const json &position) const {
    double pos = 0.0;
    std::string text;
    if (!to_number(position, pos, text)) {
        return fail(ErrorCode::ValidationError, fmt::format("Invalid seek position: {}", text));
    }
    if (pos < SEEK_MIN || pos > SEEK_MAX) {
        return fail(ErrorCode::ValidationError,
                    fmt::format("Seek position must be between {} and {}, got {}", SEEK_MIN, SEEK_MAX, text));
    }
    Command cmd(CommandKind::Seek);
    cmd.seconds_ = pos;
    Validation v;
    v.command = cmd;
    return v;
}

Validation Validator::skip(const json &seconds) const {
    double delta = 0.0;
    std::string text;
    if (!to_number(seconds, delta, text)) {
        return fail(ErrorCode::ValidationError, fmt::format("Invalid skip duration: {}", text));
    }
    if (delta < SKIP_MIN || delta > SKIP_MAX) {
        return fail(ErrorCode::ValidationError,
                    fmt::format("Skip duration must be between {} and {}, got {}", SKIP_MIN, SKIP_MAX, text));
    }
    Command cmd(CommandKind::Skip);
    cmd.seconds_ = delta;
    Validation v;
    v.command = cmd;
    return v;
}

Validation Validator::volume(const json &level) const {
    double d = 0.0;
    std::string text;
    if (!to_number(level, d, text) || d != std::floor(d)) {
        return fail(ErrorCode::ValidationError, fmt::format("Invalid volume value: {}", text));
    }
    if (d < VOLUME_MIN || d > VOLUME_MAX) {
        return fail(ErrorCode::ValidationError,
                    fmt::format("Volume must be between {} and {}, got {}", VOLUME_MIN, VOLUME_MAX, text));
    }
    Command cmd(CommandKind::Volume);
    cmd.volume_ = (int)d;
    Validation v;
    v.command = cmd;
    return v;
}

Validation Validator::output_route(const json &route) const {
    const auto &routes = config::allowed_output_routes();
    std::string value = route.is_string() ? route.get<std::string>() : route.dump();
    if (!route.is_string() || std::find(routes.begin(), routes.end(), value) == routes.end()) {
        std::string list;
        for (const auto &r : routes) {
            if (!list.empty()) list += ", ";
            list += r;
        }
        return fail(ErrorCode::ValidationError,
                    fmt::format("Invalid HDMI output: {}. Must be one of [{}]", value, list));
    }
    Command cmd(CommandKind::OutputRoute);
    cmd.route_ = value;
    Validation v;
    v.command = cmd;
    return v;
}

Validation Validator::simple(CommandKind kind) const {
    switch (kind) {
        case CommandKind::Pause:
        case CommandKind::Resume:
        case CommandKind::Toggle:
        case CommandKind::Stop:
            break;
        default:
            return fail(ErrorCode::ValidationError, fmt::format("'{}' needs a parameter", kind_name(kind)));
    }
    Validation v;
    v.command = Command(kind);
    return v;
}
