/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_TRANSFER_HPP
#define HPLAYER_TRANSFER_HPP

#pragma once

#include <common.hpp>
#include <session.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace hplayer::transfer {

    using UploadId = uint64_t;

    /**
     * @brief Chunked file ingestion into the media directory.
     *
     * Data goes to a hidden temp file next to its destination and is renamed into
     * place only on success; every failure path removes the temp file. The pipeline
     * has its own lock and never touches the playback session.
     *
     * A handle is driven by one thread at a time (the uploading connection).
     */
    class TransferPipeline {
    public:
        TransferPipeline(std::string media_dir, uint64_t max_upload_size);
        ~TransferPipeline();

        TransferPipeline(const TransferPipeline&) = delete;
        TransferPipeline& operator=(const TransferPipeline&) = delete;

        /**
         * @brief Open a transfer.
         * @return None, InvalidFilename, Conflict (same name already uploading),
         *         TransferFailed (declared size above the ceiling) or IoError
         */
        common::ErrorCode begin_upload(const std::string &raw_name, std::optional<uint64_t> declared_size,
                                       UploadId &id, std::string &err);

        /// Append bytes. On failure the transfer is already discarded.
        common::ErrorCode write_chunk(UploadId id, const char *data, size_t len, std::string &err);

        /// Verify the size, flush and rename into place.
        common::ErrorCode complete_upload(UploadId id, session::MediaFile &out, std::string &err);

        /// Discard the transfer. Unknown ids are ignored.
        void abort_upload(UploadId id);

        size_t active() const;

        void set_max_upload_size(uint64_t bytes);

    private:
        struct Job {
            std::string name;
            std::string dest;
            std::string temp;
            uint64_t received = 0;
            std::optional<uint64_t> declared;
            std::ofstream out;
        };

        std::unique_ptr<Job> take(UploadId id);
        Job *find(UploadId id);
        void discard(std::unique_ptr<Job> job, const std::string &why);

        std::string dir_;
        uint64_t max_size_;

        mutable std::mutex mtx_;
        UploadId next_id_;
        std::unordered_map<UploadId, std::unique_ptr<Job>> jobs_;
        std::unordered_set<std::string> names_;
    };

} // namespace hplayer::transfer

#endif // HPLAYER_TRANSFER_HPP
