/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <controller.hpp>
#include <server.hpp>
#include <logger.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

using namespace hplayer::log;

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--log <log_file>] [--log-level debug|info|warn|error] [--port <n>]\n";
    std::cerr << "Example: " << prog << " --config ~/headless-mpv-config.json --log hplayerd.log --log-level info\n";
}

int main(int argc, char** argv) {
    std::string config_path = hplayer::config::default_config_path();
    std::string log_file;
    std::string log_level_str;
    int port_override = -1;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto need_value = [&](const char *flag) -> bool {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value\n";
                return false;
            }
            return true;
        };
        if (a == "--config") {
            if (!need_value("--config")) return 1;
            config_path = argv[++i];
        } else if (a == "--log") {
            if (!need_value("--log")) return 1;
            log_file = argv[++i];
        } else if (a == "--log-level") {
            if (!need_value("--log-level")) return 1;
            log_level_str = argv[++i];
        } else if (a == "--port") {
            if (!need_value("--port")) return 1;
            char *end = nullptr;
            long p = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || p <= 0 || p > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            port_override = (int)p;
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    hplayer::config::Config cfg;
    std::vector<std::string> warnings;
    std::string err;
    if (!hplayer::config::load_config(config_path, cfg, warnings, err)) {
        std::cerr << "Warning: " << err << " - using defaults\n";
    }
    if (port_override > 0) cfg.port = port_override;
    if (!log_level_str.empty()) cfg.log_level = log_level_str;
    if (!log_file.empty()) cfg.log_file = log_file;

    Level desired_level = Level::INFO;
    if (!parse_level(cfg.log_level, desired_level)) {
        std::cerr << "Warning: unknown log level '" << cfg.log_level << "', using info.\n";
        desired_level = Level::INFO;
    }
    Logger::instance().set_level(desired_level);

    // If a log file is configured, test opening it first for append/writability
    if (!cfg.log_file.empty()) {
        std::ofstream ofs(cfg.log_file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << cfg.log_file << "' for append, continuing without file logging\n";
        } else {
            ofs.close();
            Logger::instance().open_logfile(cfg.log_file);
        }
    }
    for (const auto &w : warnings) LOG_GEN_WARN("Config: {}", w);

    // SIGINT/SIGTERM are taken synchronously by a dedicated thread
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    hplayer::config::ConfigStore store(config_path, cfg);
    hplayer::controller::Controller ctl(store);
    ctl.start();

    hplayer::server::Server srv(cfg.port, ctl);
    if (!srv.start()) {
        LOG_GEN_ERROR("Server failed to start on port {}", cfg.port);
        ctl.shutdown();
        return 1;
    }

    std::atomic<bool> signalled(false);
    std::thread sig_thread([&srv, &signalled, sigs]() {
        int signo = 0;
        if (sigwait(&sigs, &signo) == 0) {
            LOG_GEN_INFO("Received signal {} ({}), shutting down", signo, strsignal(signo));
        }
        signalled = true;
        srv.stop();
    });

    LOG_GEN_INFO("hplayerd ready: port={} media_dir='{}' player='{}'", srv.port(), cfg.media_dir, cfg.player_cmd);
    srv.runLoop();

    // runLoop may also end on an epoll error; wake the signal thread in that case
    if (!signalled) pthread_kill(sig_thread.native_handle(), SIGTERM);
    sig_thread.join();

    ctl.shutdown();
    LOG_GEN_INFO("hplayerd exited cleanly");
    return 0;
}
