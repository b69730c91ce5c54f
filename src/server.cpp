/*
* @license
* (C) zachbabanov
*
*/

#include <server.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <chrono>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/epoll.h>
#include <sys/time.h>
#include <unistd.h>

using namespace hplayer::server;
using namespace hplayer::common;
using namespace hplayer::controller;
using namespace hplayer::log;

using json = nlohmann::json;

namespace hplayer::server {

    json error_reply(ErrorCode code, const std::string &message) {
        json j;
        j["success"] = false;
        j["error"] = message;
        j["code"] = error_name(code);
        return j;
    }

    static json param(const json &req, const char *key) {
        auto it = req.find(key);
        return it == req.end() ? json(nullptr) : *it;
    }

    Dispatch dispatch_request(Controller &ctl, const std::string &line) {
        Dispatch d;
        json req = json::parse(line, nullptr, false);
        if (req.is_discarded() || !req.is_object()) {
            d.reply = error_reply(ErrorCode::ValidationError, "Malformed request: expected one JSON object per line");
            return d;
        }
        auto opIt = req.find("op");
        if (opIt == req.end() || !opIt->is_string()) {
            d.reply = error_reply(ErrorCode::ValidationError, "Missing 'op'");
            return d;
        }
        d.op = opIt->get<std::string>();
        const auto &v = ctl.validator();
        const std::string &op = d.op;

        if (op == "status") {
            d.reply = json{{"success", true}, {"status", session::to_json(ctl.get_status())}};
        } else if (op == "health") {
            json h = to_json(ctl.health());
            h["success"] = true;
            d.reply = h;
        } else if (op == "files") {
            std::vector<session::MediaFile> files;
            std::string err;
            ErrorCode ec = ctl.list_media(files, err);
            if (ec != ErrorCode::None) {
                d.reply = error_reply(ec, err);
            } else {
                json arr = json::array();
                for (const auto &f : files) arr.push_back(session::to_json(f));
                d.reply = json{{"success", true}, {"files", arr}};
            }
        } else if (op == "config") {
            d.reply = json{{"success", true}, {"config", ctl.config()}};
        } else if (op == "config_set") {
            OpResult r = ctl.update_config(param(req, "config"));
            if (r.ok()) {
                d.reply = json{{"success", true}, {"config", ctl.config()}};
            } else {
                d.reply = error_reply(r.code, r.message);
            }
        } else if (op == "play") {
            if (req.contains("file")) {
                d.pending = ctl.submit(v.play(req["file"]));
            } else {
                d.pending = ctl.submit(v.simple(validator::CommandKind::Resume));
            }
        } else if (op == "pause") {
            d.pending = ctl.submit(v.simple(validator::CommandKind::Pause));
        } else if (op == "resume") {
            d.pending = ctl.submit(v.simple(validator::CommandKind::Resume));
        } else if (op == "toggle") {
            d.pending = ctl.submit(v.simple(validator::CommandKind::Toggle));
        } else if (op == "stop") {
            d.pending = ctl.submit(v.simple(validator::CommandKind::Stop));
        } else if (op == "seek") {
            d.pending = ctl.submit(v.seek(param(req, "position")));
        } else if (op == "skip") {
            d.pending = ctl.submit(v.skip(param(req, "seconds")));
        } else if (op == "volume") {
            d.pending = ctl.submit(v.volume(param(req, "level")));
        } else if (op == "output") {
            d.pending = ctl.submit(v.output_route(param(req, "route")));
        } else if (op == "delete") {
            json f = param(req, "file");
            d.pending = ctl.submit_delete(f.is_string() ? f.get<std::string>() : std::string());
        } else if (op == "upload") {
            json name = param(req, "name");
            json size = param(req, "size");
            if (!name.is_string()) {
                d.reply = error_reply(ErrorCode::InvalidFilename, "Filename cannot be empty");
            } else if (!size.is_number_unsigned()) {
                d.reply = error_reply(ErrorCode::ValidationError, "Upload needs a non-negative integer 'size'");
            } else {
                d.upload = true;
                d.uploadName = name.get<std::string>();
                d.uploadSize = size.get<uint64_t>();
            }
        } else {
            d.reply = error_reply(ErrorCode::ValidationError, fmt::format("Unknown op '{}'", op));
        }
        return d;
    }

} // namespace hplayer::server

Server::Server(int tcpPort, Controller &ctl)
        : tcpPort_(tcpPort),
          tcpListenSocket_(INVALID_SOCK),
          epollFd_(-1),
          nextClientId_(1),
          ctl_(ctl),
          stop_(false) {
}

Server::~Server() {
    {
        std::lock_guard<std::mutex> lk(uploadMtx_);
        for (sock_t fd : uploadFds_) ::shutdown(fd, SHUT_RDWR);
    }
    for (auto &kv : uploadThreads_) {
        if (kv.second.joinable()) kv.second.join();
    }
    // sockets of finished uploads are in returned_, their clients_ slots are placeholders
    for (auto &c : returned_) closeSocket(c.tcp_fd);
    for (auto &kv : clients_) {
        if (kv.second.state != State::UPLOADING) closeSocket(kv.first);
    }
    if (epollFd_ >= 0) close(epollFd_);
    if (tcpListenSocket_ != INVALID_SOCK) closeSocket(tcpListenSocket_);
}

bool Server::setupListenSocket() {
    tcpListenSocket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (tcpListenSocket_ == INVALID_SOCK) {
        LOG_NET_ERROR("Failed to create listen socket");
        return false;
    }

    int opt = 1;
    setsockopt(tcpListenSocket_, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(tcpPort_);

    if (bind(tcpListenSocket_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_NET_ERROR("bind failed on port {}: {}", tcpPort_, strerror(errno));
        closeSocket(tcpListenSocket_);
        tcpListenSocket_ = INVALID_SOCK;
        return false;
    }

    if (setSocketNonBlocking(tcpListenSocket_) < 0) {
        LOG_NET_ERROR("set nonblocking failed for listen socket");
        closeSocket(tcpListenSocket_);
        tcpListenSocket_ = INVALID_SOCK;
        return false;
    }

    if (listen(tcpListenSocket_, 64) < 0) {
        LOG_NET_ERROR("listen failed");
        closeSocket(tcpListenSocket_);
        tcpListenSocket_ = INVALID_SOCK;
        return false;
    }

    if (tcpPort_ == 0) {
        socklen_t len = sizeof(addr);
        if (getsockname(tcpListenSocket_, (sockaddr*)&addr, &len) == 0) tcpPort_ = ntohs(addr.sin_port);
    }
    LOG_NET_INFO("Listening on TCP port {}", tcpPort_);
    return true;
}

bool Server::start() {
    if (!setupListenSocket()) return false;

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        LOG_NET_ERROR("epoll_create1 failed: {}", strerror(errno));
        return false;
    }
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = tcpListenSocket_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, tcpListenSocket_, &ev) < 0) {
        LOG_NET_ERROR("epoll_ctl add listen failed: {}", strerror(errno));
        return false;
    }
    return true;
}

void Server::stop() {
    stop_ = true;
}

void Server::runLoop() {
    std::vector<epoll_event> events(64);
    while (!stop_) {
        // short timeout: pending controller results are polled, not signalled
        int n = epoll_wait(epollFd_, events.data(), (int)events.size(), 50);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_NET_ERROR("epoll_wait failed: {}", strerror(errno));
            break;
        }
        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;
            if (fd == tcpListenSocket_) {
                acceptNewConnections();
            } else if (clients_.count(fd)) {
                handleTcpEvent(fd, ev);
            }
        }

        collectReturnedUploads();

        std::vector<sock_t> closing;
        for (auto &kv : clients_) {
            Connection &c = kv.second;
            if (c.state == State::PROCESSING) checkPending(c);
            if (c.state == State::READING) processBufferedRequests(c);
            if (c.state == State::CLOSING) closing.push_back(kv.first);
        }
        for (sock_t fd : closing) closeConnection(fd);
    }
    LOG_NET_INFO("Server loop finished");
}

void Server::acceptNewConnections() {
    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        sock_t cfd = accept4(tcpListenSocket_, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd == INVALID_SOCK) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            LOG_NET_WARN("accept failed: {}", strerror(errno));
            break;
        }
        if (clients_.size() >= MAX_CLIENTS) {
            LOG_NET_WARN("Too many clients ({}), refusing fd={}", clients_.size(), cfd);
            closeSocket(cfd);
            continue;
        }
        if (setSocketNonBlocking(cfd) < 0) {
            LOG_NET_ERROR("set nonblocking for client failed");
            closeSocket(cfd);
            continue;
        }

        // enable keepalive and TCP_NODELAY for accepted socket
        enableSocketKeepAliveAndNoDelay(cfd);

        epoll_event cev{};
        cev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP;
        cev.data.fd = cfd;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, cfd, &cev) < 0) {
            LOG_NET_ERROR("epoll_ctl add client failed: {}", strerror(errno));
            closeSocket(cfd);
            continue;
        }

        Connection conn(cfd);
        conn.clientId = nextClientId_++;
        clients_.emplace(cfd, std::move(conn));
        char hostbuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &caddr.sin_addr, hostbuf, sizeof(hostbuf));
        LOG_NET_INFO("Accepted connection from {}:{} fd={} client_id={}", hostbuf, ntohs(caddr.sin_port), cfd, nextClientId_ - 1);
    }
}

void Server::handleTcpEvent(sock_t fd, uint32_t events) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    Connection &conn = it->second;

    if (events & EPOLLOUT) {
        flushOutBuffer(conn);
    }

    if (events & EPOLLIN) {
        char buf[BUFFER_SIZE];
        while (true) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n > 0) {
                conn.inBuffer.append(buf, buf + n);
                if (conn.inBuffer.size() > MAX_REQUEST_LINE && conn.inBuffer.find('\n') == std::string::npos) {
                    LOG_NET_WARN("Request line too long from client_id={}", conn.clientId);
                    conn.inBuffer.clear();
                    conn.closeAfterWrite = true;
                    queueReply(conn, error_reply(ErrorCode::ValidationError, "Request line too long"));
                    break;
                }
            } else if (n == 0) {
                LOG_NET_INFO("peer closed connection fd={}", fd);
                conn.state = State::CLOSING;
                return;
            } else {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                if (errno == EINTR) continue;
                LOG_NET_INFO("recv error on fd={} err={}", fd, strerror(errno));
                conn.state = State::CLOSING;
                return;
            }
        }
    }

    if (events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
        conn.state = State::CLOSING;
    }
}

void Server::processBufferedRequests(Connection &c) {
    while (c.state == State::READING) {
        size_t pos = c.inBuffer.find('\n');
        if (pos == std::string::npos) return;
        std::string line = c.inBuffer.substr(0, pos);
        c.inBuffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        LOG_NET_DEBUG("client_id={} request: {}", c.clientId, line);
        Dispatch d = dispatch_request(ctl_, line);
        if (d.upload) {
            beginUpload(c, d);
        } else if (d.pending) {
            c.pending = std::move(d.pending);
            c.pendingOp = d.op;
            c.state = State::PROCESSING;
            checkPending(c);
        } else if (d.reply) {
            queueReply(c, *d.reply);
        }
    }
}

void Server::checkPending(Connection &c) {
    if (!c.pending) {
        c.state = State::READING;
        return;
    }
    if (c.pending->wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;
    OpResult r = c.pending->get();
    c.pending.reset();
    c.state = State::READING;
    if (!r.ok()) {
        LOG_NET_INFO("client_id={} {} failed: {} ({})", c.clientId, c.pendingOp, r.message, error_name(r.code));
    }
    queueReply(c, to_json(r));
}

void Server::queueReply(Connection &c, const json &reply) {
    c.outBuffer += reply.dump();
    c.outBuffer += "\n";
    flushOutBuffer(c);
}

void Server::flushOutBuffer(Connection &c) {
    while (!c.outBuffer.empty()) {
        ssize_t n = ::send(c.tcp_fd, c.outBuffer.data(), c.outBuffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            c.outBuffer.erase(0, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (c.state != State::WRITING) {
                c.state = State::WRITING;
                epoll_event ev{};
                ev.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLHUP;
                ev.data.fd = c.tcp_fd;
                epoll_ctl(epollFd_, EPOLL_CTL_MOD, c.tcp_fd, &ev);
            }
            return;
        }
        LOG_NET_INFO("send failed fd={} err={}", c.tcp_fd, strerror(errno));
        c.state = State::CLOSING;
        return;
    }

    if (c.state == State::WRITING) {
        c.state = State::READING;
        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP;
        ev.data.fd = c.tcp_fd;
        epoll_ctl(epollFd_, EPOLL_CTL_MOD, c.tcp_fd, &ev);
    }
    if (c.closeAfterWrite) c.state = State::CLOSING;
}

void Server::beginUpload(Connection &c, Dispatch &d) {
    transfer::UploadId id = 0;
    std::string err;
    ErrorCode ec = ctl_.transfer().begin_upload(d.uploadName, d.uploadSize, id, err);
    if (ec != ErrorCode::None) {
        // the announced bytes follow anyway and cannot be told apart from requests
        c.closeAfterWrite = true;
        queueReply(c, error_reply(ec, err));
        return;
    }

    epoll_ctl(epollFd_, EPOLL_CTL_DEL, c.tcp_fd, nullptr);
    c.state = State::UPLOADING;
    Connection moved = std::move(c);
    sock_t fd = moved.tcp_fd;
    {
        std::lock_guard<std::mutex> lk(uploadMtx_);
        uploadFds_.insert(fd);
        uploadThreads_[fd] = std::thread(&Server::uploadWorker, this, std::move(moved), id, d.uploadSize);
    }
    // the slot stays in clients_ as UPLOADING until the thread hands the socket back
    LOG_NET_INFO("fd={} handed to upload thread for '{}' ({} bytes)", fd, d.uploadName, d.uploadSize);
}

void Server::uploadWorker(Connection conn, transfer::UploadId id, uint64_t size) {
    auto &pipeline = ctl_.transfer();
    std::string err;
    ErrorCode ec = ErrorCode::None;
    uint64_t received = 0;

    // bytes that arrived together with the request line
    if (!conn.inBuffer.empty()) {
        size_t take = (size_t)std::min<uint64_t>(conn.inBuffer.size(), size);
        if (take > 0) {
            ec = pipeline.write_chunk(id, conn.inBuffer.data(), take, err);
            received += take;
            conn.inBuffer.erase(0, take);
        }
    }

    bool disconnected = false;
    if (ec == ErrorCode::None && received < size) {
        setSocketBlocking(conn.tcp_fd);
        timeval tv{};
        tv.tv_sec = 30;
        setsockopt(conn.tcp_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::vector<char> buf(TRANSFER_CHUNK_SIZE);
        while (received < size && !stop_) {
            size_t want = (size_t)std::min<uint64_t>(buf.size(), size - received);
            ssize_t n = ::recv(conn.tcp_fd, buf.data(), want, 0);
            if (n > 0) {
                ec = pipeline.write_chunk(id, buf.data(), (size_t)n, err);
                if (ec != ErrorCode::None) break;
                received += (uint64_t)n;
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            err = n == 0 ? std::string("client disconnected")
                         : fmt::format("receive failed: {}", strerror(errno));
            disconnected = true;
            break;
        }
        if (!disconnected && received < size) {
            err = "server shutting down";
            disconnected = true;
        }
    }

    json reply;
    if (disconnected) {
        pipeline.abort_upload(id);
    } else if (ec != ErrorCode::None) {
        // the pipeline already discarded the transfer; rest of the body is unusable
        reply = error_reply(ec, err);
        conn.closeAfterWrite = true;
    } else {
        session::MediaFile f;
        ec = pipeline.complete_upload(id, f, err);
        if (ec == ErrorCode::None) {
            reply = json{{"success", true}, {"file", session::to_json(f)}};
        } else {
            reply = error_reply(ec, err);
        }
    }

    {
        std::lock_guard<std::mutex> lk(uploadMtx_);
        uploadFds_.erase(conn.tcp_fd);
        if (disconnected) {
            LOG_XFER_WARN("Upload from client_id={} abandoned: {}", conn.clientId, err);
            conn.state = State::CLOSING;
        } else {
            setSocketNonBlocking(conn.tcp_fd);
            conn.state = State::READING;
            conn.outBuffer += reply.dump();
            conn.outBuffer += "\n";
        }
        returned_.push_back(std::move(conn));
    }
}

void Server::collectReturnedUploads() {
    std::vector<Connection> back;
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lk(uploadMtx_);
        back.swap(returned_);
        for (const auto &c : back) {
            auto t = uploadThreads_.find(c.tcp_fd);
            if (t == uploadThreads_.end()) continue;
            finished.push_back(std::move(t->second));
            uploadThreads_.erase(t);
        }
    }
    // each worker hands its socket back as its last step
    for (auto &t : finished) {
        if (t.joinable()) t.join();
    }
    for (auto &c : back) {
        sock_t fd = c.tcp_fd;
        auto it = clients_.find(fd);
        if (it == clients_.end()) {
            closeSocket(fd);
            continue;
        }
        it->second = std::move(c);
        Connection &conn = it->second;
        if (conn.state == State::CLOSING) continue;

        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP | EPOLLHUP;
        ev.data.fd = fd;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            LOG_NET_ERROR("epoll_ctl re-add fd={} failed: {}", fd, strerror(errno));
            conn.state = State::CLOSING;
            continue;
        }
        flushOutBuffer(conn);
    }
}

size_t Server::uploadThreadCount() {
    std::lock_guard<std::mutex> lk(uploadMtx_);
    return uploadThreads_.size();
}

void Server::closeConnection(sock_t fd) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    if (it->second.state == State::UPLOADING) return;
    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    closeSocket(fd);
    LOG_NET_INFO("Closed connection fd={} client_id={}", fd, it->second.clientId);
    clients_.erase(it);
}
