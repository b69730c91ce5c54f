/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_MEDIA_LIBRARY_HPP
#define HPLAYER_MEDIA_LIBRARY_HPP

#pragma once

#include <common.hpp>
#include <session.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hplayer::media {

    struct DiskSpace {
        uint64_t total = 0;
        uint64_t used = 0;
        uint64_t free = 0;
        double percent_used = 0.0;
    };

    nlohmann::json to_json(const DiskSpace &d);

    /**
     * @brief The managed media directory. The filesystem is the only source of truth.
     */
    class MediaLibrary {
    public:
        explicit MediaLibrary(std::string media_dir);

        /// Create the directory if needed.
        bool ensure_directory(std::string &err) const;

        /// Regular files with an allowed extension, sorted by name. Hidden files are skipped.
        common::ErrorCode list(std::vector<session::MediaFile> &out, std::string &err) const;

        /// Stat one file by its normalized name.
        common::ErrorCode stat_file(const std::string &name, session::MediaFile &out, std::string &err) const;

        /**
         * @brief Remove a file.
         * @return None, InvalidFilename, ValidationError (missing) or IoError
         */
        common::ErrorCode remove(const std::string &raw_name, std::string &normalized, std::string &err) const;

        common::ErrorCode disk_space(DiskSpace &out, std::string &err) const;

        const std::string &dir() const { return dir_; }

    private:
        std::string dir_;
    };

} // namespace hplayer::media

#endif // HPLAYER_MEDIA_LIBRARY_HPP
