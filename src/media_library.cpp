/*
* @license
* (C) zachbabanov
*
*/

#include <media_library.hpp>
#include <validator.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <dirent.h>
#include <unistd.h>

using namespace hplayer::media;
using namespace hplayer::common;
using namespace hplayer::session;

using json = nlohmann::json;

namespace hplayer::media {

    json to_json(const DiskSpace &d) {
        json j;
        j["total"] = d.total;
        j["used"] = d.used;
        j["free"] = d.free;
        j["percent_used"] = d.percent_used;
        return j;
    }

} // namespace hplayer::media

MediaLibrary::MediaLibrary(std::string media_dir)
    : dir_(std::move(media_dir)) {}

bool MediaLibrary::ensure_directory(std::string &err) const {
    struct stat st;
    if (::stat(dir_.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return true;
        err = fmt::format("media path '{}' is not a directory", dir_);
        return false;
    }
    // create missing parents one level at a time
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir_.find('/', pos + 1);
        partial = dir_.substr(0, pos);
        if (partial.empty()) continue;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            err = fmt::format("cannot create '{}': {}", partial, std::strerror(errno));
            return false;
        }
    }
    LOG_GEN_INFO("Created media directory '{}'", dir_);
    return true;
}

ErrorCode MediaLibrary::list(std::vector<MediaFile> &out, std::string &err) const {
    out.clear();
    DIR *d = ::opendir(dir_.c_str());
    if (!d) {
        err = fmt::format("cannot open media directory '{}': {}", dir_, std::strerror(errno));
        LOG_GEN_ERROR("{}", err);
        return ErrorCode::IoError;
    }
    while (struct dirent *ent = ::readdir(d)) {
        std::string name = ent->d_name;
        if (name.empty() || name[0] == '.') continue;
        if (!validator::has_allowed_extension(name)) continue;
        MediaFile f;
        std::string ignored;
        if (stat_file(name, f, ignored) == ErrorCode::None) out.push_back(std::move(f));
    }
    ::closedir(d);
    std::sort(out.begin(), out.end(), [](const MediaFile &a, const MediaFile &b) { return a.name < b.name; });
    return ErrorCode::None;
}

ErrorCode MediaLibrary::stat_file(const std::string &name, MediaFile &out, std::string &err) const {
    std::string path = dir_ + "/" + name;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        err = fmt::format("File not found: {}", name);
        return ErrorCode::ValidationError;
    }
    if (!S_ISREG(st.st_mode)) {
        err = fmt::format("Not a regular file: {}", name);
        return ErrorCode::ValidationError;
    }
    out.name = name;
    out.size = (uint64_t)st.st_size;
    out.modified = (int64_t)st.st_mtime;
    return ErrorCode::None;
}

ErrorCode MediaLibrary::remove(const std::string &raw_name, std::string &normalized, std::string &err) const {
    std::string resolved;
    ErrorCode ec = validator::check_filename(dir_, raw_name, normalized, resolved, err);
    if (ec != ErrorCode::None) return ec;

    MediaFile f;
    ec = stat_file(normalized, f, err);
    if (ec != ErrorCode::None) return ec;

    if (::unlink(resolved.c_str()) != 0) {
        err = fmt::format("cannot delete '{}': {}", normalized, std::strerror(errno));
        LOG_GEN_ERROR("{}", err);
        return ErrorCode::IoError;
    }
    LOG_GEN_INFO("Deleted media file '{}'", normalized);
    return ErrorCode::None;
}

ErrorCode MediaLibrary::disk_space(DiskSpace &out, std::string &err) const {
    struct statvfs vfs;
    if (::statvfs(dir_.c_str(), &vfs) != 0) {
        err = fmt::format("statvfs('{}') failed: {}", dir_, std::strerror(errno));
        return ErrorCode::IoError;
    }
    out.total = (uint64_t)vfs.f_blocks * vfs.f_frsize;
    out.free = (uint64_t)vfs.f_bavail * vfs.f_frsize;
    out.used = out.total - (uint64_t)vfs.f_bfree * vfs.f_frsize;
    out.percent_used = out.total ? (double)out.used * 100.0 / (double)out.total : 0.0;
    out.percent_used = (double)(int64_t)(out.percent_used * 100.0 + 0.5) / 100.0;
    return ErrorCode::None;
}
