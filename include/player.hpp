/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_PLAYER_HPP
#define HPLAYER_PLAYER_HPP

#pragma once

#include <common.hpp>

#include <string>
#include <vector>
#include <memory>

#include <sys/types.h>

namespace hplayer::player {

/**
 * @brief PlayerProcess abstracts launching an external player (mpv) and tracking its lifetime.
 *
 * - Uses fork + execvp; stdin/stdout/stderr of the child go to /dev/null.
 * - Exec failures (missing binary, permissions) are reported synchronously through a
 *   close-on-exec status pipe, so launch() either returns a running process or an OS reason.
 * - The child is reaped exactly once, by whichever of poll_exit()/wait_for_exit()/terminate() sees it first.
 */
class PlayerProcess {
public:
    static std::unique_ptr<PlayerProcess> launch(const std::string &player_cmd,
                                                 const std::vector<std::string> &app_args,
                                                 std::string &error);

    ~PlayerProcess();

    pid_t pid() const;

    /**
     * @brief Non-blocking liveness check.
     * @return true if the process has exited (exit_status() is then valid).
     */
    bool poll_exit();

    /// Wait up to timeout_ms for the process to exit on its own.
    bool wait_for_exit(int timeout_ms);

    bool has_exited() const;

    /// Raw wait status of the exited child (see waitpid).
    int exit_status() const;

    /// "exit code 1" / "killed by signal 9" style description of exit_status().
    std::string describe_exit() const;

    /// SIGTERM, wait up to grace_ms, then SIGKILL. No-op if already exited.
    void terminate(int grace_ms = common::TERM_GRACE_MS);

private:
    PlayerProcess();
    struct Impl;
    Impl *impl_;
};

} // namespace hplayer::player

#endif // HPLAYER_PLAYER_HPP
