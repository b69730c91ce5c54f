/*
* @license
* (C) zachbabanov
*
*/

#include <channel.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace hplayer::channel;
using namespace hplayer::common;
using namespace hplayer::events;

using json = nlohmann::json;

CommandChannel::CommandChannel(int reply_timeout_ms)
    : timeout_ms_(reply_timeout_ms),
      fd_(INVALID_SOCK),
      owns_endpoint_(false),
      running_(false),
      closed_(true),
      next_request_id_(1) {}

CommandChannel::~CommandChannel() {
    close();
}

static sock_t try_connect_unix(const std::string &path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    sock_t fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return INVALID_SOCK;
    if (::connect(fd, (sockaddr*)&addr, sizeof(addr)) != 0) {
        ::close(fd);
        return INVALID_SOCK;
    }
    return fd;
}

ErrorCode CommandChannel::connect(const std::string &path, bool owns_endpoint,
                                  int attempts, int total_wait_ms,
                                  const std::function<bool()> &alive) {
    close();

    if (path.empty() || path.size() >= sizeof(sockaddr_un::sun_path)) {
        LOG_CHAN_ERROR("Invalid IPC socket path '{}'", path);
        return ErrorCode::ChannelUnavailable;
    }
    path_ = path;
    owns_endpoint_ = owns_endpoint;

    if (attempts < 1) attempts = 1;
    const auto interval = std::chrono::milliseconds(total_wait_ms / attempts);

    sock_t fd = INVALID_SOCK;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (alive && !alive()) {
            LOG_CHAN_WARN("Player went away while waiting for socket '{}'", path);
            return ErrorCode::ChannelUnavailable;
        }
        fd = try_connect_unix(path);
        if (fd != INVALID_SOCK) {
            LOG_CHAN_DEBUG("Connected to '{}' on attempt {}/{}", path, attempt, attempts);
            break;
        }
        if (attempt < attempts) std::this_thread::sleep_for(interval);
    }
    if (fd == INVALID_SOCK) {
        LOG_CHAN_WARN("IPC socket '{}' not available after {} attempts", path, attempts);
        return ErrorCode::ChannelUnavailable;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        fd_ = fd;
        closed_ = false;
        pending_.clear();
        replies_.clear();
    }
    running_ = true;
    reader_ = std::thread(&CommandChannel::reader_loop, this);
    LOG_CHAN_INFO("Channel connected endpoint='{}' fd={}", path_, fd_);
    return ErrorCode::None;
}

ErrorCode CommandChannel::send(const json &command) {
    json reply;
    return send(command, reply);
}

ErrorCode CommandChannel::send(const json &command, json &reply) {
    uint64_t id = 0;
    sock_t fd = INVALID_SOCK;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_ || fd_ == INVALID_SOCK) return ErrorCode::ChannelClosed;
        id = next_request_id_++;
        pending_.insert(id);
        fd = fd_;
    }

    json request;
    request["command"] = command;
    request["request_id"] = id;
    std::string line = request.dump() + "\n";

    bool written;
    {
        std::lock_guard<std::mutex> wl(write_mtx_);
        written = sendAll(fd, line.data(), line.size());
    }
    if (!written) {
        std::lock_guard<std::mutex> lk(mtx_);
        pending_.erase(id);
        LOG_CHAN_WARN("Write failed for request_id={} cmd={}", id, command.dump());
        return ErrorCode::ChannelClosed;
    }
    LOG_CHAN_TRACE("-> {}", request.dump());

    std::unique_lock<std::mutex> lk(mtx_);
    bool got = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms_), [&] {
        return replies_.count(id) > 0 || closed_;
    });
    pending_.erase(id);
    auto it = replies_.find(id);
    if (it == replies_.end()) {
        if (!got) {
            LOG_CHAN_WARN("Timeout after {} ms waiting for reply request_id={} cmd={}", timeout_ms_, id, command.dump());
            return ErrorCode::ChannelTimeout;
        }
        return ErrorCode::ChannelClosed;
    }
    reply = std::move(it->second);
    replies_.erase(it);
    lk.unlock();

    auto err = reply.find("error");
    if (err == reply.end() || !err->is_string() || err->get<std::string>() != "success") {
        LOG_CHAN_DEBUG("Player rejected cmd={} reply={}", command.dump(), reply.dump());
        return ErrorCode::CommandRejected;
    }
    return ErrorCode::None;
}

ErrorCode CommandChannel::get_property(const std::string &name, json &value) {
    json reply;
    ErrorCode ec = send(json::array({"get_property", name}), reply);
    if (ec == ErrorCode::None) {
        auto it = reply.find("data");
        value = (it != reply.end()) ? *it : json();
    }
    return ec;
}

ErrorCode CommandChannel::set_property(const std::string &name, const json &value) {
    return send(json::array({"set_property", name, value}));
}

void CommandChannel::observe(EventSink sink) {
    std::lock_guard<std::mutex> lk(sink_mtx_);
    sink_ = std::move(sink);
}

void CommandChannel::emit(const PlayerEvent &ev) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mtx_);
        sink = sink_;
    }
    if (sink) sink(ev);
}

bool CommandChannel::is_connected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !closed_ && fd_ != INVALID_SOCK;
}

void CommandChannel::close() {
    running_ = false;
    sock_t fd;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        fd = fd_;
    }
    if (fd != INVALID_SOCK) ::shutdown(fd, SHUT_RDWR);
    if (reader_.joinable()) reader_.join();

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (fd_ != INVALID_SOCK) {
            closeSocket(fd_);
            fd_ = INVALID_SOCK;
        }
        closed_ = true;
        pending_.clear();
        replies_.clear();
    }
    cv_.notify_all();

    if (owns_endpoint_ && !path_.empty()) {
        if (::unlink(path_.c_str()) == 0) {
            LOG_CHAN_DEBUG("Removed socket file '{}'", path_);
        }
        owns_endpoint_ = false;
    }
}

void CommandChannel::handle_line(const std::string &line) {
    if (line.empty()) return;
    json msg = json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        LOG_CHAN_DEBUG("Ignoring malformed line from player: {}", line);
        return;
    }
    LOG_CHAN_TRACE("<- {}", line);

    if (msg.contains("event")) {
        auto ev = parse_event(msg);
        if (ev) emit(*ev);
        return;
    }

    auto rid = msg.find("request_id");
    if (rid == msg.end() || !rid->is_number_unsigned()) return;
    uint64_t id = rid->get<uint64_t>();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!pending_.count(id)) {
            LOG_CHAN_DEBUG("Dropping late reply request_id={}", id);
            return;
        }
        replies_[id] = std::move(msg);
    }
    cv_.notify_all();
}

void CommandChannel::reader_loop() {
    sock_t fd;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        fd = fd_;
    }
    std::string inbuf;
    char buf[BUFFER_SIZE];
    bool lost = false;

    while (running_) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, 200);
        if (pr < 0) {
            if (errno == EINTR) continue;
            LOG_CHAN_WARN("poll failed on fd={} err={}", fd, strerror(errno));
            lost = true;
            break;
        }
        if (pr == 0) continue;

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            inbuf.append(buf, (size_t)n);
            size_t pos;
            while ((pos = inbuf.find('\n')) != std::string::npos) {
                std::string line = inbuf.substr(0, pos);
                inbuf.erase(0, pos + 1);
                handle_line(line);
            }
        } else if (n == 0) {
            LOG_CHAN_INFO("Player closed IPC socket fd={}", fd);
            lost = true;
            break;
        } else {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            LOG_CHAN_WARN("recv error on fd={} err={}", fd, strerror(errno));
            lost = true;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
    // only an unexpected loss is reported; close() clears running_ first
    if (lost && running_) emit(ChannelLost{});
}
