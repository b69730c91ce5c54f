/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

using namespace hplayer::client;
using namespace hplayer::common;

using json = nlohmann::json;

Client::Client(const std::string &host, int port, int timeoutMs)
        : host_(host), port_(port), timeoutMs_(timeoutMs), sock_(INVALID_SOCK) {}

Client::~Client() {
    close();
}

bool Client::connect() {
    close();

    addrinfo hints{};
    addrinfo *res = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int rc = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &res);
    if (rc != 0) {
        error_ = fmt::format("getaddrinfo failed for {}:{}: {}", host_, port_, gai_strerror(rc));
        LOG_NET_ERROR("{}", error_);
        return false;
    }

    for (addrinfo *rp = res; rp; rp = rp->ai_next) {
        sock_ = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (sock_ == INVALID_SOCK) continue;
        if (::connect(sock_, rp->ai_addr, rp->ai_addrlen) == 0) break;
        closeSocket(sock_);
        sock_ = INVALID_SOCK;
    }
    freeaddrinfo(res);
    if (sock_ == INVALID_SOCK) {
        error_ = fmt::format("cannot connect to {}:{}: {}", host_, port_, strerror(errno));
        LOG_NET_ERROR("{}", error_);
        return false;
    }

    enableSocketKeepAliveAndNoDelay(sock_);
    timeval tv{};
    tv.tv_sec = timeoutMs_ / 1000;
    tv.tv_usec = (timeoutMs_ % 1000) * 1000;
    setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    LOG_NET_DEBUG("Connected to {}:{}", host_, port_);
    return true;
}

void Client::close() {
    if (sock_ != INVALID_SOCK) {
        closeSocket(sock_);
        sock_ = INVALID_SOCK;
    }
    inBuffer_.clear();
}

bool Client::readLine(std::string &line) {
    char buf[BUFFER_SIZE];
    while (true) {
        size_t pos = inBuffer_.find('\n');
        if (pos != std::string::npos) {
            line = inBuffer_.substr(0, pos);
            inBuffer_.erase(0, pos + 1);
            return true;
        }
        ssize_t n = ::recv(sock_, buf, sizeof(buf), 0);
        if (n > 0) {
            inBuffer_.append(buf, (size_t)n);
        } else if (n == 0) {
            error_ = "server closed the connection";
            return false;
        } else {
            if (errno == EINTR) continue;
            error_ = (errno == EAGAIN || errno == EWOULDBLOCK)
                     ? std::string("timed out waiting for reply")
                     : fmt::format("recv failed: {}", strerror(errno));
            return false;
        }
    }
}

bool Client::request(const json &req, json &reply) {
    if (sock_ == INVALID_SOCK && !connect()) return false;

    std::string line = req.dump() + "\n";
    if (!sendAll(sock_, line.data(), line.size())) {
        error_ = "send failed";
        return false;
    }
    std::string resp;
    if (!readLine(resp)) return false;
    reply = json::parse(resp, nullptr, false);
    if (reply.is_discarded()) {
        error_ = "malformed reply: " + resp;
        return false;
    }
    return true;
}

bool Client::upload(const std::string &localPath, const std::string &remoteName, json &reply) {
    struct stat st;
    if (::stat(localPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        error_ = fmt::format("cannot read '{}'", localPath);
        return false;
    }
    std::ifstream ifs(localPath, std::ios::binary);
    if (!ifs) {
        error_ = fmt::format("cannot open '{}'", localPath);
        return false;
    }
    std::string name = remoteName;
    if (name.empty()) {
        size_t slash = localPath.find_last_of('/');
        name = slash == std::string::npos ? localPath : localPath.substr(slash + 1);
    }

    if (sock_ == INVALID_SOCK && !connect()) return false;

    json req;
    req["op"] = "upload";
    req["name"] = name;
    req["size"] = (uint64_t)st.st_size;
    std::string line = req.dump() + "\n";
    if (!sendAll(sock_, line.data(), line.size())) {
        error_ = "send failed";
        return false;
    }

    std::vector<char> chunk(TRANSFER_CHUNK_SIZE);
    uint64_t sent = 0;
    while (ifs) {
        ifs.read(chunk.data(), (std::streamsize)chunk.size());
        std::streamsize got = ifs.gcount();
        if (got <= 0) break;
        if (!sendAll(sock_, chunk.data(), (size_t)got)) {
            // the server may have refused the upload already; its reply explains why
            LOG_NET_WARN("Upload interrupted after {} bytes", sent);
            break;
        }
        sent += (uint64_t)got;
    }
    LOG_XFER_INFO("Sent {} of {} bytes of '{}'", sent, (uint64_t)st.st_size, localPath);

    std::string resp;
    if (!readLine(resp)) return false;
    reply = json::parse(resp, nullptr, false);
    if (reply.is_discarded()) {
        error_ = "malformed reply: " + resp;
        return false;
    }
    return true;
}
