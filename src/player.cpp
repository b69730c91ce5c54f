/*
* @license
* (C) zachbabanov
*
*/

#include <player.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

using namespace hplayer::player;
using namespace hplayer::common;
using namespace hplayer::log;

/*
 * Implementation notes:
 * - A pipe with O_CLOEXEC on both ends is created before fork. If execvp succeeds the
 *   write end disappears and the parent reads EOF; if it fails the child writes errno.
 * - The parent keeps only the pid; the child's stdio is redirected to /dev/null.
 */

struct PlayerProcess::Impl {
    pid_t pid;
    bool exited;
    int status;
    Impl() : pid(-1), exited(false), status(0) {}
};

PlayerProcess::PlayerProcess(): impl_(new Impl()) {}
PlayerProcess::~PlayerProcess() { terminate(0); delete impl_; }

/**
 * @brief Helper to build argv-like array for execvp.
 */
static std::vector<char*> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.c_str()));
    for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

std::unique_ptr<PlayerProcess> PlayerProcess::launch(const std::string &player_cmd,
                                                     const std::vector<std::string> &app_args,
                                                     std::string &error) {
    auto p = std::unique_ptr<PlayerProcess>(new PlayerProcess());

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + strerror(errno);
        LOG_PROC_ERROR("Player: status pipe creation failed: {}", error);
        return nullptr;
    }

    // built before fork: no allocation in the child
    std::vector<char*> argv = build_argv(player_cmd, app_args);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork: ") + strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        LOG_PROC_ERROR("Player: fork failed: {}", error);
        return nullptr;
    }
    if (pid == 0) {
        close(status_pipe[0]);
        // the daemon blocks SIGINT/SIGTERM for its sigwait thread and ignores SIGPIPE
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execvp(player_cmd.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == (ssize_t)sizeof(child_errno)) {
        int st = 0;
        waitpid(pid, &st, 0);
        error = "exec '" + player_cmd + "': " + strerror(child_errno);
        LOG_PROC_ERROR("Player spawn failed: {}", error);
        return nullptr;
    }

    p->impl_->pid = pid;
    LOG_PROC_INFO("Player started: cmd='{}' pid={} args={}", player_cmd, (int)pid, app_args.size());
    return p;
}

pid_t PlayerProcess::pid() const {
    return impl_->pid;
}

bool PlayerProcess::poll_exit() {
    if (impl_->exited) return true;
    if (impl_->pid <= 0) return true;
    int st = 0;
    pid_t r = waitpid(impl_->pid, &st, WNOHANG);
    if (r == impl_->pid) {
        impl_->exited = true;
        impl_->status = st;
        LOG_PROC_DEBUG("Player pid={} exited: {}", (int)impl_->pid, describe_exit());
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // somebody else reaped it; treat as gone
        impl_->exited = true;
        return true;
    }
    return false;
}

bool PlayerProcess::wait_for_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!poll_exit()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

bool PlayerProcess::has_exited() const {
    return impl_->exited;
}

int PlayerProcess::exit_status() const {
    return impl_->status;
}

std::string PlayerProcess::describe_exit() const {
    if (!impl_->exited) return "running";
    int st = impl_->status;
    if (WIFEXITED(st)) return "exit code " + std::to_string(WEXITSTATUS(st));
    if (WIFSIGNALED(st)) return "killed by signal " + std::to_string(WTERMSIG(st));
    return "exited";
}

void PlayerProcess::terminate(int grace_ms) {
    if (!impl_ || impl_->pid <= 0 || poll_exit()) return;

    kill(impl_->pid, SIGTERM);
    if (grace_ms > 0 && wait_for_exit(grace_ms)) {
        LOG_PROC_INFO("Player process terminated pid={}", (int)impl_->pid);
        return;
    }
    LOG_PROC_WARN("Player pid={} did not exit after SIGTERM, forcing kill", (int)impl_->pid);
    kill(impl_->pid, SIGKILL);
    int st = 0;
    if (waitpid(impl_->pid, &st, 0) == impl_->pid) {
        impl_->status = st;
    }
    impl_->exited = true;
    LOG_PROC_INFO("Player process killed pid={}", (int)impl_->pid);
}
