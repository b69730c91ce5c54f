/*
* @license
* (C) zachbabanov
*
*/

// Stand-in for mpv in tests: speaks the JSON IPC protocol on --input-ipc-server
// and simulates a clock-driven playback position.
//
// Extra switches (pass through player_extra_args):
//   --fake-mode=no-socket   never create the socket
//   --fake-mode=exit        exit with status 3 right away
//   --fake-mode=mute        accept commands but never reply
//   --fake-eof-after=<ms>   reach end of file after this much playback
//   --fake-log=<path>       append the name of every command received
//   --fake-numeric-error=<command>
//                           answer that command with a numeric "error" field

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using clock_type = std::chrono::steady_clock;

namespace {

    constexpr double kDuration = 600.0;

    struct Player {
        std::string path;
        bool paused = false;
        int volume = 100;
        double base_pos = 0.0;
        clock_type::time_point base_time = clock_type::now();
        long eof_after_ms = -1;
        bool eof = false;
        std::map<int, std::string> observed;
        std::string log_path;
        std::string numeric_error;

        double position() const {
            if (paused || eof) return base_pos;
            double dt = std::chrono::duration<double>(clock_type::now() - base_time).count();
            return std::min(kDuration, base_pos + dt);
        }
        void rebase(double pos) {
            base_pos = std::max(0.0, std::min(kDuration, pos));
            base_time = clock_type::now();
        }
        json value(const std::string &name) const {
            if (name == "time-pos") return position();
            if (name == "duration") return kDuration;
            if (name == "volume") return (double)volume;
            if (name == "pause") return paused;
            if (name == "eof-reached") return eof;
            if (name == "path") return path;
            return json();
        }
    };

    bool write_line(int fd, const json &j) {
        std::string s = j.dump() + "\n";
        size_t off = 0;
        while (off < s.size()) {
            ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += (size_t)n;
        }
        return true;
    }

    void notify(int fd, const Player &p, const std::string &name) {
        for (const auto &kv : p.observed) {
            if (kv.second != name) continue;
            json ev;
            ev["event"] = "property-change";
            ev["id"] = kv.first;
            ev["name"] = name;
            ev["data"] = p.value(name);
            write_line(fd, ev);
        }
    }

    // Returns false when the player should exit.
    bool handle(int fd, Player &p, const json &msg, bool mute) {
        json reply;
        reply["request_id"] = msg.value("request_id", 0);
        reply["error"] = "success";
        const json cmd = msg.value("command", json::array());
        const std::string name = (cmd.is_array() && !cmd.empty() && cmd[0].is_string()) ? cmd[0].get<std::string>() : "";
        std::string changed;
        bool quit = false;

        if (!p.log_path.empty()) {
            std::ofstream log(p.log_path, std::ios::app);
            log << name << "\n";
        }
        if (!name.empty() && name == p.numeric_error) {
            reply["error"] = 42;
            if (!mute) write_line(fd, reply);
            return true;
        }

        if (name == "observe_property" && cmd.size() >= 3) {
            p.observed[cmd[1].get<int>()] = cmd[2].get<std::string>();
            changed = cmd[2].get<std::string>();
        } else if (name == "get_property" && cmd.size() >= 2) {
            json v = p.value(cmd[1].get<std::string>());
            if (v.is_null()) reply["error"] = "property unavailable";
            else reply["data"] = v;
        } else if (name == "set_property" && cmd.size() >= 3) {
            const std::string prop = cmd[1].get<std::string>();
            if (prop == "pause" && cmd[2].is_boolean()) {
                p.rebase(p.position());
                p.paused = cmd[2].get<bool>();
                changed = "pause";
            } else if (prop == "volume" && cmd[2].is_number()) {
                p.volume = (int)cmd[2].get<double>();
                changed = "volume";
            } else {
                reply["error"] = "unsupported";
            }
        } else if (name == "seek" && cmd.size() >= 2 && cmd[1].is_number()) {
            std::string mode = cmd.size() >= 3 && cmd[2].is_string() ? cmd[2].get<std::string>() : "relative";
            double target = cmd[1].get<double>();
            p.rebase(mode == "absolute" ? target : p.position() + target);
            p.eof = false;
            changed = "time-pos";
        } else if (name == "ao-reload") {
            // nothing to reload
        } else if (name == "quit") {
            quit = true;
        } else {
            reply["error"] = "invalid parameter";
        }

        if (mute) return true;
        if (!write_line(fd, reply)) return false;
        if (!changed.empty()) notify(fd, p, changed);
        return !quit;
    }

} // namespace

int main(int argc, char **argv) {
    std::signal(SIGPIPE, SIG_IGN);

    std::string socket_path;
    std::string mode;
    Player p;
    bool files = false;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (files) {
            p.path = a;
        } else if (a == "--") {
            files = true;
        } else if (a.rfind("--input-ipc-server=", 0) == 0) {
            socket_path = a.substr(std::strlen("--input-ipc-server="));
        } else if (a.rfind("--fake-mode=", 0) == 0) {
            mode = a.substr(std::strlen("--fake-mode="));
        } else if (a.rfind("--fake-eof-after=", 0) == 0) {
            p.eof_after_ms = std::atol(a.c_str() + std::strlen("--fake-eof-after="));
        } else if (a.rfind("--fake-log=", 0) == 0) {
            p.log_path = a.substr(std::strlen("--fake-log="));
        } else if (a.rfind("--fake-numeric-error=", 0) == 0) {
            p.numeric_error = a.substr(std::strlen("--fake-numeric-error="));
        } else if (a.rfind("--volume=", 0) == 0) {
            p.volume = std::atoi(a.c_str() + std::strlen("--volume="));
        }
    }

    if (mode == "exit") return 3;
    if (mode == "no-socket" || socket_path.empty()) {
        for (;;) std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    int lfd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
    ::unlink(socket_path.c_str());
    if (lfd < 0 || ::bind(lfd, (sockaddr*)&addr, sizeof(addr)) != 0 || ::listen(lfd, 4) != 0) return 2;

    const bool mute = mode == "mute";
    auto play_start = clock_type::now();
    int cfd = -1;
    std::string inbuf;
    auto last_tick = clock_type::now();
    bool running = true;

    while (running) {
        pollfd fds[2];
        int nfds = 0;
        fds[nfds++] = pollfd{lfd, POLLIN, 0};
        if (cfd >= 0) fds[nfds++] = pollfd{cfd, POLLIN, 0};
        ::poll(fds, (nfds_t)nfds, 50);

        bool replaced = false;
        if (fds[0].revents & POLLIN) {
            int nc = ::accept(lfd, nullptr, nullptr);
            if (nc >= 0) {
                if (cfd >= 0) ::close(cfd);
                cfd = nc;
                inbuf.clear();
                replaced = true;
            }
        }
        if (!replaced && cfd >= 0 && nfds > 1 && (fds[1].revents & (POLLIN | POLLHUP))) {
            char buf[4096];
            ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
            if (n <= 0) {
                ::close(cfd);
                cfd = -1;
            } else {
                inbuf.append(buf, (size_t)n);
                size_t pos;
                while (running && (pos = inbuf.find('\n')) != std::string::npos) {
                    std::string line = inbuf.substr(0, pos);
                    inbuf.erase(0, pos + 1);
                    json msg = json::parse(line, nullptr, false);
                    if (msg.is_discarded() || !msg.is_object()) continue;
                    try {
                        running = handle(cfd, p, msg, mute);
                    } catch (const json::exception &) {
                        write_line(cfd, json{{"request_id", msg.value("request_id", 0)}, {"error", "invalid parameter"}});
                    }
                }
            }
        }

        auto now = clock_type::now();
        if (!p.eof && p.eof_after_ms >= 0 &&
            std::chrono::duration_cast<std::chrono::milliseconds>(now - play_start).count() >= p.eof_after_ms) {
            p.rebase(p.position());
            p.eof = true;
            if (cfd >= 0 && !mute) {
                p.paused = true;
                notify(cfd, p, "pause");
                notify(cfd, p, "eof-reached");
            }
        }
        if (cfd >= 0 && !mute && now - last_tick >= std::chrono::milliseconds(200)) {
            last_tick = now;
            if (!p.paused && !p.eof) notify(cfd, p, "time-pos");
        }
    }

    if (cfd >= 0) ::close(cfd);
    ::close(lfd);
    ::unlink(socket_path.c_str());
    return 0;
}
