/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <channel.hpp>
#include <player.hpp>

#include "test_util.hpp"

#include <atomic>
#include <mutex>
#include <vector>

using namespace hplayer::channel;
using namespace hplayer::common;
using namespace hplayer::events;
using hplayer::player::PlayerProcess;
using hplayer::test::TempDir;
using hplayer::test::wait_until;
using json = nlohmann::json;

TEST_CASE("connect fails fast when nobody listens", "[channel]") {
    TempDir dir;
    CommandChannel ch(500);
    REQUIRE(ch.connect(dir.file("none.sock"), false, 3, 150) == ErrorCode::ChannelUnavailable);
    REQUIRE_FALSE(ch.is_connected());

    json reply;
    REQUIRE(ch.send(json::array({"get_property", "pause"}), reply) == ErrorCode::ChannelClosed);
}

TEST_CASE("request/reply and property events against a player", "[channel]") {
    TempDir dir;
    const std::string sock = dir.file("mpv.sock");
    std::string err;
    auto proc = PlayerProcess::launch(HPLAYER_FAKE_MPV, {"--input-ipc-server=" + sock, "--", "clip.mp4"}, err);
    REQUIRE(proc);

    CommandChannel ch(2000);
    PlayerProcess *p = proc.get();
    REQUIRE(ch.connect(sock, true, 20, 2000, [p] { return !p->poll_exit(); }) == ErrorCode::None);
    REQUIRE(ch.is_connected());
    REQUIRE(ch.endpoint() == sock);

    std::mutex mtx;
    std::vector<PlayerEvent> seen;
    std::atomic<bool> lost(false);
    ch.observe([&](const PlayerEvent &ev) {
        if (std::holds_alternative<ChannelLost>(ev)) lost = true;
        std::lock_guard<std::mutex> lk(mtx);
        seen.push_back(ev);
    });

    json value;
    REQUIRE(ch.get_property("duration", value) == ErrorCode::None);
    REQUIRE(value.get<double>() == Approx(600.0));
    REQUIRE(ch.get_property("path", value) == ErrorCode::None);
    REQUIRE(value == "clip.mp4");

    json reply;
    REQUIRE(ch.send(json::array({"no-such-command"}), reply) == ErrorCode::CommandRejected);
    REQUIRE(reply.value("error", std::string()) == "invalid parameter");

    REQUIRE(ch.send(json::array({"observe_property", OBSERVE_VOLUME, "volume"})) == ErrorCode::None);
    REQUIRE(ch.set_property("volume", 40) == ErrorCode::None);
    REQUIRE(wait_until([&] {
        std::lock_guard<std::mutex> lk(mtx);
        for (const auto &ev : seen) {
            if (std::holds_alternative<VolumeChanged>(ev) && std::get<VolumeChanged>(ev).level == 40) return true;
        }
        return false;
    }, 2000));

    // the player hanging up on its own is reported once
    REQUIRE(ch.send(json::array({"quit"})) == ErrorCode::None);
    REQUIRE(wait_until([&] { return lost.load(); }, 2000));
    REQUIRE_FALSE(ch.is_connected());
    REQUIRE(proc->wait_for_exit(2000));

    ch.close();
    ch.close();
}

TEST_CASE("close by the owner is not a loss", "[channel]") {
    TempDir dir;
    const std::string sock = dir.file("mpv.sock");
    std::string err;
    auto proc = PlayerProcess::launch(HPLAYER_FAKE_MPV, {"--input-ipc-server=" + sock}, err);
    REQUIRE(proc);

    CommandChannel ch(2000);
    REQUIRE(ch.connect(sock, true, 20, 2000) == ErrorCode::None);
    std::atomic<bool> lost(false);
    ch.observe([&](const PlayerEvent &ev) {
        if (std::holds_alternative<ChannelLost>(ev)) lost = true;
    });
    ch.close();
    REQUIRE_FALSE(lost.load());
    proc->terminate(1000);
}
