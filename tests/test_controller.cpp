/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <controller.hpp>

#include "test_util.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <thread>

#include <sys/stat.h>

using namespace hplayer::controller;
using namespace hplayer::common;
using namespace hplayer::session;
using hplayer::config::Config;
using hplayer::config::ConfigStore;
using hplayer::test::TempDir;
using hplayer::test::write_file;
using hplayer::test::wait_until;
using json = nlohmann::json;

namespace {

    Config test_config(const TempDir &media, const TempDir &run) {
        Config c = hplayer::config::default_config();
        c.media_dir = media.path();
        c.runtime_dir = run.path();
        c.player_cmd = HPLAYER_FAKE_MPV;
        c.audio_in_headless = false;
        c.probe_interval_ms = 100;
        c.poll_interval_ms = 200;
        c.command_timeout_ms = 1000;
        return c;
    }

    // Media directory with one playable file, a runtime directory and a started controller.
    struct Fixture {
        TempDir media;
        TempDir run;
        ConfigStore store;
        Controller ctl;

        explicit Fixture(const std::function<void(Config&)> &tweak = nullptr)
            : store("", make(media, run, tweak)), ctl(store) {
            ctl.start();
        }

        static Config make(const TempDir &media, const TempDir &run, const std::function<void(Config&)> &tweak) {
            write_file(media.file("clip.mp4"), std::string(1024, 'v'));
            Config c = test_config(media, run);
            if (tweak) tweak(c);
            return c;
        }
    };

    size_t sockets_in(const std::string &dir) {
        size_t n = 0;
        for (const auto &e : std::filesystem::directory_iterator(dir)) {
            if (e.is_socket()) ++n;
        }
        return n;
    }

    // Lines of a fake player command log equal to command.
    size_t commands_logged(const std::string &path, const std::string &command) {
        std::ifstream in(path);
        size_t n = 0;
        for (std::string line; std::getline(in, line);) {
            if (line == command) ++n;
        }
        return n;
    }

} // namespace

TEST_CASE("idle controller", "[controller]") {
    Fixture f;

    OpResult r = f.ctl.stop();
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Idle);
    REQUIRE(f.ctl.stop().ok());

    r = f.ctl.pause();
    REQUIRE(r.code == ErrorCode::NoActiveSession);
    REQUIRE(r.message == "No active playback");
    REQUIRE(f.ctl.skip(10).code == ErrorCode::NoActiveSession);
    REQUIRE(f.ctl.set_volume(50).code == ErrorCode::NoActiveSession);

    r = f.ctl.play("missing.mp4");
    REQUIRE(r.code == ErrorCode::ValidationError);
    REQUIRE(r.message == "File not found: missing.mp4");
    REQUIRE(f.ctl.session().pid == -1);
    REQUIRE(f.ctl.get_status().state == PlaybackState::Idle);

    REQUIRE(f.ctl.seek(90000).code == ErrorCode::ValidationError);

    HealthView h = f.ctl.health();
    REQUIRE(h.healthy);
    REQUIRE_FALSE(h.player_running);
    REQUIRE(h.media_dir == f.media.path());
    REQUIRE(h.disk);
    REQUIRE(to_json(h)["status"] == "healthy");
}

TEST_CASE("play, control and stop a session", "[controller][player]") {
    Fixture f;

    OpResult r = f.ctl.play("clip.mp4");
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Playing);
    REQUIRE(r.view.current_file == std::string("clip.mp4"));
    Session s = f.ctl.session();
    REQUIRE(s.pid > 0);
    REQUIRE(sockets_in(f.run.path()) == 1);

    r = f.ctl.seek(30);
    REQUIRE(r.ok());
    REQUIRE(r.view.position >= 30.0);

    r = f.ctl.skip("-10");
    REQUIRE(r.ok());
    REQUIRE(r.view.position >= 20.0);
    REQUIRE(r.view.position < 30.0);
    REQUIRE(f.ctl.skip(0).ok());

    r = f.ctl.pause();
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Paused);
    REQUIRE(r.view.paused);
    REQUIRE(f.ctl.pause().view.state == PlaybackState::Paused);

    r = f.ctl.toggle_pause();
    REQUIRE(r.view.state == PlaybackState::Playing);
    REQUIRE(f.ctl.resume().view.state == PlaybackState::Playing);

    r = f.ctl.set_volume(40);
    REQUIRE(r.ok());
    REQUIRE(r.view.volume == 40);
    REQUIRE(f.ctl.config()["volume"] == 40);

    REQUIRE(wait_until([&] { return f.ctl.get_status().duration > 0.0; }, 3000));

    r = f.ctl.stop();
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Idle);
    REQUIRE_FALSE(r.view.current_file);
    REQUIRE(f.ctl.session().pid == -1);
    REQUIRE(sockets_in(f.run.path()) == 0);
    REQUIRE(::kill(s.pid, 0) != 0);
}

TEST_CASE("seek and skip reload the audio output", "[controller][player]") {
    std::string log;
    Fixture f([&](Config &c) {
        log = c.runtime_dir + "/commands.log";
        c.player_extra_args = {"--fake-log=" + log};
    });

    REQUIRE(f.ctl.play("clip.mp4").ok());
    REQUIRE(commands_logged(log, "ao-reload") == 0);

    REQUIRE(f.ctl.seek(30).ok());
    REQUIRE(commands_logged(log, "seek") == 1);
    REQUIRE(commands_logged(log, "ao-reload") == 1);

    REQUIRE(f.ctl.skip(-5).ok());
    REQUIRE(commands_logged(log, "seek") == 2);
    REQUIRE(commands_logged(log, "ao-reload") == 2);

    SECTION("skip 0 sends nothing") {
        REQUIRE(f.ctl.skip(0).ok());
        REQUIRE(commands_logged(log, "seek") == 2);
        REQUIRE(commands_logged(log, "ao-reload") == 2);
    }
}

TEST_CASE("player errors that are not text", "[controller][player]") {
    SECTION("failed audio reload does not fail the seek") {
        Fixture f([](Config &c) { c.player_extra_args = {"--fake-numeric-error=ao-reload"}; });
        REQUIRE(f.ctl.play("clip.mp4").ok());

        OpResult r = f.ctl.seek(10);
        REQUIRE(r.ok());
        REQUIRE(r.view.state == PlaybackState::Playing);
        REQUIRE(f.ctl.get_status().state == PlaybackState::Playing);
    }

    SECTION("rejected seek is reported, session keeps playing") {
        Fixture f([](Config &c) { c.player_extra_args = {"--fake-numeric-error=seek"}; });
        REQUIRE(f.ctl.play("clip.mp4").ok());

        OpResult r = f.ctl.seek(10);
        REQUIRE(r.code == ErrorCode::CommandRejected);
        REQUIRE(r.message.find("42") != std::string::npos);
        REQUIRE(f.ctl.get_status().state == PlaybackState::Playing);
        REQUIRE(f.ctl.stop().ok());
    }
}

TEST_CASE("a second play replaces the session", "[controller][player]") {
    Fixture f;
    write_file(f.media.file("other.mkv"), "x");

    REQUIRE(f.ctl.play("clip.mp4").ok());
    Session first = f.ctl.session();
    OpResult r = f.ctl.play("other.mkv");
    REQUIRE(r.ok());
    REQUIRE(r.view.current_file == std::string("other.mkv"));
    Session second = f.ctl.session();
    REQUIRE(second.generation > first.generation);
    REQUIRE(second.pid != first.pid);
    REQUIRE(sockets_in(f.run.path()) == 1);
    REQUIRE(f.ctl.stop().ok());
}

TEST_CASE("crashed player is detected and replaced", "[controller][player]") {
    Fixture f;
    REQUIRE(f.ctl.play("clip.mp4").ok());
    Session s = f.ctl.session();
    REQUIRE(::kill(s.pid, SIGKILL) == 0);

    REQUIRE(wait_until([&] { return f.ctl.get_status().state == PlaybackState::Failed; }, 3000));
    SessionView v = f.ctl.get_status();
    REQUIRE(v.last_error);
    REQUIRE(f.ctl.pause().code == ErrorCode::NoActiveSession);

    OpResult r = f.ctl.play("clip.mp4");
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Playing);
    REQUIRE_FALSE(r.view.last_error);
    REQUIRE(f.ctl.session().generation > s.generation);
    REQUIRE(f.ctl.stop().ok());
}

TEST_CASE("end of media leaves the player ready", "[controller][player]") {
    Fixture f([](Config &c) { c.player_extra_args = {"--fake-eof-after=300"}; });
    REQUIRE(f.ctl.play("clip.mp4").ok());
    REQUIRE(wait_until([&] { return f.ctl.get_status().state == PlaybackState::Ready; }, 3000));
    REQUIRE(f.ctl.pause().code == ErrorCode::NoActiveSession);
    REQUIRE(f.ctl.session().pid > 0);
    REQUIRE(f.ctl.stop().view.state == PlaybackState::Idle);
}

TEST_CASE("start failures", "[controller][player]") {
    SECTION("binary missing") {
        Fixture f([](Config &c) { c.player_cmd = "/nonexistent/hplayer-mpv"; });
        OpResult r = f.ctl.play("clip.mp4");
        REQUIRE(r.code == ErrorCode::SpawnError);
        REQUIRE(r.view.state == PlaybackState::Failed);
        REQUIRE(r.view.last_error);
        REQUIRE(f.ctl.stop().view.state == PlaybackState::Idle);
    }
    SECTION("player exits during startup") {
        Fixture f([](Config &c) { c.player_extra_args = {"--fake-mode=exit"}; });
        OpResult r = f.ctl.play("clip.mp4");
        REQUIRE(r.code == ErrorCode::SpawnError);
        REQUIRE(r.view.state == PlaybackState::Failed);
    }
    SECTION("socket never appears") {
        Fixture f([](Config &c) { c.player_extra_args = {"--fake-mode=no-socket"}; });
        OpResult r = f.ctl.play("clip.mp4");
        REQUIRE(r.code == ErrorCode::ChannelUnavailable);
        REQUIRE(r.view.state == PlaybackState::Failed);
        REQUIRE(f.ctl.session().pid == -1);
    }
}

TEST_CASE("unresponsive player fails the session", "[controller][player]") {
    Fixture f([](Config &c) {
        c.player_extra_args = {"--fake-mode=mute"};
        c.command_timeout_ms = 200;
    });
    OpResult r = f.ctl.play("clip.mp4");
    REQUIRE(r.code == ErrorCode::ChannelTimeout);
    REQUIRE(r.view.state == PlaybackState::Failed);
    REQUIRE(f.ctl.session().pid == -1);
}

TEST_CASE("queue limit refuses extra commands", "[controller]") {
    Fixture f([](Config &c) {
        c.player_extra_args = {"--fake-mode=mute"};
        c.command_timeout_ms = 400;
        c.max_pending_commands = 1;
    });
    auto playing = f.ctl.submit(f.ctl.validator().play("clip.mp4"));
    // let the worker pick up the play
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto queued = f.ctl.submit(f.ctl.validator().simple(hplayer::validator::CommandKind::Stop));
    OpResult refused = f.ctl.stop();
    REQUIRE(refused.code == ErrorCode::Busy);

    REQUIRE(playing.get().code == ErrorCode::ChannelTimeout);
    REQUIRE(queued.get().ok());
    REQUIRE(f.ctl.get_status().state == PlaybackState::Idle);
}

TEST_CASE("uploads and listing while playing", "[controller][transfer]") {
    Fixture f;
    REQUIRE(f.ctl.play("clip.mp4").ok());

    hplayer::transfer::UploadId id = 0;
    std::string err;
    REQUIRE(f.ctl.transfer().begin_upload("fresh.webm", 4, id, err) == ErrorCode::None);
    REQUIRE(f.ctl.transfer().write_chunk(id, "abcd", 4, err) == ErrorCode::None);
    MediaFile mf;
    REQUIRE(f.ctl.transfer().complete_upload(id, mf, err) == ErrorCode::None);

    REQUIRE(f.ctl.get_status().state == PlaybackState::Playing);
    std::vector<MediaFile> files;
    REQUIRE(f.ctl.list_media(files, err) == ErrorCode::None);
    REQUIRE(files.size() == 2);
    REQUIRE(files[1].name == "fresh.webm");
    REQUIRE(f.ctl.stop().ok());
}

TEST_CASE("deleting the loaded file stops playback first", "[controller]") {
    Fixture f;
    REQUIRE(f.ctl.play("clip.mp4").ok());
    OpResult r = f.ctl.delete_media("clip.mp4");
    REQUIRE(r.ok());
    REQUIRE(r.view.state == PlaybackState::Idle);
    REQUIRE_FALSE(std::filesystem::exists(f.media.file("clip.mp4")));

    REQUIRE(f.ctl.delete_media("clip.mp4").code == ErrorCode::ValidationError);
    REQUIRE(f.ctl.delete_media("../etc/hosts.mp4").code == ErrorCode::InvalidFilename);
}

TEST_CASE("output route change restarts at the same position", "[controller][player]") {
    Fixture f;

    // idle: only remembered
    REQUIRE(f.ctl.set_output_route("HDMI-A-1").ok());
    REQUIRE(f.ctl.get_status().output_route == "HDMI-A-1");
    REQUIRE(f.ctl.config()["hdmi_output"] == "HDMI-A-1");

    REQUIRE(f.ctl.play("clip.mp4").ok());
    REQUIRE(f.ctl.seek(100).ok());
    REQUIRE(f.ctl.pause().ok());
    Session before = f.ctl.session();

    OpResult r = f.ctl.set_output_route("HDMI-A-2");
    REQUIRE(r.ok());
    REQUIRE(r.view.output_route == "HDMI-A-2");
    REQUIRE(r.view.state == PlaybackState::Paused);
    REQUIRE(r.view.current_file == std::string("clip.mp4"));
    REQUIRE(r.view.position >= 100.0);
    REQUIRE(f.ctl.session().pid != before.pid);

    REQUIRE_FALSE(f.ctl.set_output_route("DP-1").ok());
    REQUIRE(f.ctl.stop().ok());
}

TEST_CASE("config updates through the controller", "[controller][config]") {
    Fixture f;
    REQUIRE(f.ctl.update_config(json{{"max_upload_size", 2048}}).ok());
    REQUIRE(f.ctl.config()["max_upload_size"] == 2048);

    hplayer::transfer::UploadId id = 0;
    std::string err;
    REQUIRE(f.ctl.transfer().begin_upload("big.mp4", 4096, id, err) == ErrorCode::TransferFailed);

    OpResult r = f.ctl.update_config(json{{"volume", 999}});
    REQUIRE(r.code == ErrorCode::ValidationError);
    REQUIRE(f.ctl.config()["volume"] == 100);
}

TEST_CASE("config update that cannot be saved changes nothing", "[controller][config]") {
    TempDir media, run;
    ConfigStore store(run.file("gone/cfg.json"), test_config(media, run));
    Controller ctl(store);

    OpResult r = ctl.update_config(json{{"max_upload_size", 2048}});
    REQUIRE(r.code == ErrorCode::IoError);
    REQUIRE(ctl.config()["max_upload_size"] == 2147483648ULL);

    hplayer::transfer::UploadId id = 0;
    std::string err;
    REQUIRE(ctl.transfer().begin_upload("big.mp4", 4096, id, err) == ErrorCode::None);
    ctl.transfer().abort_upload(id);
}

TEST_CASE("shutdown stops the player", "[controller][player]") {
    Fixture f;
    REQUIRE(f.ctl.play("clip.mp4").ok());
    pid_t pid = f.ctl.session().pid;
    f.ctl.shutdown();
    REQUIRE(::kill(pid, 0) != 0);
    REQUIRE(f.ctl.stop().code == ErrorCode::Busy);
    f.ctl.shutdown();
}
