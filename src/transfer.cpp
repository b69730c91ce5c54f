/*
* @license
* (C) zachbabanov
*
*/

#include <transfer.hpp>
#include <validator.hpp>
#include <logger.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

using namespace hplayer::transfer;
using namespace hplayer::common;
using namespace hplayer::session;

TransferPipeline::TransferPipeline(std::string media_dir, uint64_t max_upload_size)
    : dir_(std::move(media_dir)), max_size_(max_upload_size), next_id_(1) {}

TransferPipeline::~TransferPipeline() {
    std::unordered_map<UploadId, std::unique_ptr<Job>> left;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        left.swap(jobs_);
        names_.clear();
    }
    for (auto &kv : left) discard(std::move(kv.second), "pipeline shut down");
}

ErrorCode TransferPipeline::begin_upload(const std::string &raw_name, std::optional<uint64_t> declared_size,
                                         UploadId &id, std::string &err) {
    std::string name, dest;
    ErrorCode ec = validator::check_filename(dir_, raw_name, name, dest, err);
    if (ec != ErrorCode::None) return ec;

    std::lock_guard<std::mutex> lk(mtx_);
    if (declared_size && *declared_size > max_size_) {
        err = fmt::format("File too large. Maximum size is {}MB", max_size_ / (1024 * 1024));
        return ErrorCode::TransferFailed;
    }
    if (names_.count(name)) {
        err = fmt::format("Upload of '{}' already in progress", name);
        return ErrorCode::Conflict;
    }

    auto job = std::make_unique<Job>();
    job->name = name;
    job->dest = dest;
    job->temp = fmt::format("{}/.{}.part-{}", dir_, name, next_id_);
    job->declared = declared_size;
    job->out.open(job->temp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!job->out) {
        err = fmt::format("cannot create '{}': {}", job->temp, std::strerror(errno));
        LOG_XFER_ERROR("{}", err);
        return ErrorCode::IoError;
    }

    id = next_id_++;
    names_.insert(name);
    jobs_.emplace(id, std::move(job));
    if (declared_size) {
        LOG_XFER_INFO("Upload #{} '{}' started ({} bytes)", id, name, *declared_size);
    } else {
        LOG_XFER_INFO("Upload #{} '{}' started", id, name);
    }
    return ErrorCode::None;
}

ErrorCode TransferPipeline::write_chunk(UploadId id, const char *data, size_t len, std::string &err) {
    Job *job = find(id);
    if (!job) {
        err = fmt::format("Unknown upload #{}", id);
        return ErrorCode::TransferFailed;
    }

    uint64_t limit;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        limit = max_size_;
    }
    uint64_t next = job->received + len;
    if (job->declared && next > *job->declared) {
        err = fmt::format("Received more than the declared {} bytes", *job->declared);
        discard(take(id), err);
        return ErrorCode::TransferFailed;
    }
    if (next > limit) {
        err = fmt::format("File too large. Maximum size is {}MB", limit / (1024 * 1024));
        discard(take(id), err);
        return ErrorCode::TransferFailed;
    }

    job->out.write(data, (std::streamsize)len);
    if (!job->out) {
        err = fmt::format("write to '{}' failed: {}", job->temp, std::strerror(errno));
        discard(take(id), err);
        return ErrorCode::TransferFailed;
    }
    job->received = next;
    return ErrorCode::None;
}

ErrorCode TransferPipeline::complete_upload(UploadId id, MediaFile &out, std::string &err) {
    auto job = take(id);
    if (!job) {
        err = fmt::format("Unknown upload #{}", id);
        return ErrorCode::TransferFailed;
    }
    if (job->declared && job->received != *job->declared) {
        err = fmt::format("Upload incomplete: received {} of {} bytes", job->received, *job->declared);
        discard(std::move(job), err);
        return ErrorCode::TransferFailed;
    }

    job->out.flush();
    job->out.close();
    if (job->out.fail()) {
        err = fmt::format("flush of '{}' failed", job->temp);
        discard(std::move(job), err);
        return ErrorCode::TransferFailed;
    }
    if (std::rename(job->temp.c_str(), job->dest.c_str()) != 0) {
        err = fmt::format("cannot move upload into place: {}", std::strerror(errno));
        discard(std::move(job), err);
        return ErrorCode::TransferFailed;
    }

    struct stat st;
    out.name = job->name;
    out.size = job->received;
    out.modified = ::stat(job->dest.c_str(), &st) == 0 ? (int64_t)st.st_mtime : 0;
    LOG_XFER_INFO("Upload #{} '{}' complete ({} bytes)", id, job->name, job->received);
    return ErrorCode::None;
}

void TransferPipeline::abort_upload(UploadId id) {
    auto job = take(id);
    if (job) discard(std::move(job), "aborted");
}

size_t TransferPipeline::active() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return jobs_.size();
}

void TransferPipeline::set_max_upload_size(uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    max_size_ = bytes;
}

TransferPipeline::Job *TransferPipeline::find(UploadId id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second.get();
}

std::unique_ptr<TransferPipeline::Job> TransferPipeline::take(UploadId id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return nullptr;
    auto job = std::move(it->second);
    jobs_.erase(it);
    names_.erase(job->name);
    return job;
}

void TransferPipeline::discard(std::unique_ptr<Job> job, const std::string &why) {
    if (!job) return;
    if (job->out.is_open()) job->out.close();
    if (::unlink(job->temp.c_str()) != 0 && errno != ENOENT) {
        LOG_XFER_WARN("Could not remove '{}': {}", job->temp, std::strerror(errno));
    }
    LOG_XFER_WARN("Upload '{}' discarded after {} bytes: {}", job->name, job->received, why);
}
