/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <logger.hpp>

#include <iostream>
#include <fstream>
#include <cstdlib>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <limits.h>

using json = nlohmann::json;

using namespace hplayer::client;
using namespace hplayer::log;

static bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static std::string get_exe_dir(const char *argv0) {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf)-1);
    if (len > 0) {
        buf[len] = '\0';
        std::string p(buf);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }

    // fallback: use argv0 path if it contains directory separator
    if (argv0) {
        std::string p(argv0);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
    return ".";
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--host <host>] [--port <n>] [--log <log_file>] [--log-level debug|info|warn|error] <op> [args]\n";
    std::cerr << "Ops:\n"
              << "  play [file]         start a file, or resume without one\n"
              << "  pause | resume | toggle | stop\n"
              << "  seek <seconds>      absolute position\n"
              << "  skip <seconds>      relative, may be negative\n"
              << "  volume <0-150>\n"
              << "  output <auto|HDMI-A-1|HDMI-A-2>\n"
              << "  status | health | files | config\n"
              << "  config_set '<json object>'\n"
              << "  delete <file>\n"
              << "  upload <local_file> [name]\n";
    std::cerr << "Defaults for --host/--port are read from config.json next to the binary when present.\n";
    std::cerr << "Example: " << prog << " --host 192.168.1.20 play movie.mp4\n";
}

// Build the request for everything except upload. Returns false on a usage error.
static bool build_request(const std::vector<std::string> &pos, json &req) {
    const std::string &op = pos[0];
    req["op"] = op;
    auto need = [&](size_t n) {
        if (pos.size() < n + 1) {
            std::cerr << op << " requires " << n << " argument(s)\n";
            return false;
        }
        return true;
    };

    if (op == "play") {
        if (pos.size() > 1) req["file"] = pos[1];
    } else if (op == "seek") {
        if (!need(1)) return false;
        req["position"] = pos[1];
    } else if (op == "skip") {
        if (!need(1)) return false;
        req["seconds"] = pos[1];
    } else if (op == "volume") {
        if (!need(1)) return false;
        req["level"] = pos[1];
    } else if (op == "output") {
        if (!need(1)) return false;
        req["route"] = pos[1];
    } else if (op == "delete") {
        if (!need(1)) return false;
        req["file"] = pos[1];
    } else if (op == "config_set") {
        if (!need(1)) return false;
        json patch = json::parse(pos[1], nullptr, false);
        if (patch.is_discarded() || !patch.is_object()) {
            std::cerr << "config_set expects a JSON object\n";
            return false;
        }
        req["config"] = patch;
    }
    return true;
}

int main(int argc, char **argv) {
    std::string host = "127.0.0.1";
    int port = 5000;
    std::string log_file_cli;
    std::string log_level_cli;
    std::string host_cli;
    int port_cli = -1;
    std::vector<std::string> pos;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--host") {
            if (i + 1 >= argc) { std::cerr << "--host requires a value\n"; return 1; }
            host_cli = argv[++i];
        } else if (a == "--port") {
            if (i + 1 >= argc) { std::cerr << "--port requires a value\n"; return 1; }
            char *end = nullptr;
            long p = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || p <= 0 || p > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            port_cli = (int)p;
        } else if (a == "--log") {
            if (i + 1 >= argc) { std::cerr << "--log requires a path\n"; return 1; }
            log_file_cli = argv[++i];
        } else if (a == "--log-level") {
            if (i + 1 >= argc) { std::cerr << "--log-level requires a value\n"; return 1; }
            log_level_cli = argv[++i];
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            pos.push_back(a);
        }
    }

    if (pos.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // config.json next to the binary supplies defaults, CLI overrides them
    std::string config_path = get_exe_dir(argc > 0 ? argv[0] : nullptr) + "/config.json";
    if (file_exists(config_path)) {
        try {
            std::ifstream ifs(config_path);
            json j;
            ifs >> j;
            if (j.contains("host")) host = j["host"].get<std::string>();
            if (j.contains("port")) port = j["port"].get<int>();
        } catch (const json::exception &e) {
            std::cerr << "Warning: error parsing config '" << config_path << "': " << e.what() << ", ignoring\n";
        }
    }
    if (!host_cli.empty()) host = host_cli;
    if (port_cli > 0) port = port_cli;

    // replies go to stdout, so stay quiet unless asked
    Level desired_level = Level::WARN;
    if (!log_level_cli.empty() && !parse_level(log_level_cli, desired_level)) {
        std::cerr << "Warning: unknown log level '" << log_level_cli << "', using warn.\n";
        desired_level = Level::WARN;
    }
    Logger::instance().set_level(desired_level);
    if (!log_file_cli.empty() && !Logger::instance().open_logfile(log_file_cli)) {
        std::cerr << "Warning: could not open log file '" << log_file_cli << "', continuing without file logging\n";
    }

    Client c(host, port);
    json reply;
    bool ok;
    if (pos[0] == "upload") {
        if (pos.size() < 2) {
            std::cerr << "upload requires a local file\n";
            return 1;
        }
        ok = c.upload(pos[1], pos.size() > 2 ? pos[2] : std::string(), reply);
    } else {
        json req;
        if (!build_request(pos, req)) {
            print_usage(argv[0]);
            return 1;
        }
        ok = c.request(req, reply);
    }

    if (!ok) {
        std::cerr << "Error: " << c.lastError() << "\n";
        return 2;
    }
    std::cout << reply.dump(2) << std::endl;
    return reply.value("success", false) ? 0 : 3;
}
