/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_TEST_UTIL_HPP
#define HPLAYER_TEST_UTIL_HPP

#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

namespace hplayer::test {

    /// Scratch directory under /tmp, removed with everything in it.
    class TempDir {
    public:
        TempDir() {
            char tmpl[] = "/tmp/hplayer-test-XXXXXX";
            const char *p = ::mkdtemp(tmpl);
            path_ = p ? std::string(p) : std::string("/tmp");
        }
        ~TempDir() {
            std::error_code ec;
            if (path_ != "/tmp") std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::string &path() const { return path_; }
        std::string file(const std::string &name) const { return path_ + "/" + name; }

    private:
        std::string path_;
    };

    inline void write_file(const std::string &path, const std::string &bytes) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << bytes;
    }

    inline bool wait_until(const std::function<bool()> &pred, int timeout_ms) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return pred();
    }

} // namespace hplayer::test

#endif // HPLAYER_TEST_UTIL_HPP
