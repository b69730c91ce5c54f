/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <events.hpp>

using namespace hplayer::events;
using json = nlohmann::json;

TEST_CASE("property-change notifications", "[events]") {
    auto ev = parse_event(json::parse(R"({"event":"property-change","id":1,"name":"time-pos","data":12.5})"));
    REQUIRE(ev);
    REQUIRE(std::get<PositionChanged>(*ev).seconds == Approx(12.5));

    ev = parse_event(json::parse(R"({"event":"property-change","id":2,"name":"pause","data":true})"));
    REQUIRE(ev);
    REQUIRE(std::get<PauseChanged>(*ev).paused);

    ev = parse_event(json::parse(R"({"event":"property-change","id":4,"name":"volume","data":79.6})"));
    REQUIRE(ev);
    REQUIRE(std::get<VolumeChanged>(*ev).level == 80);

    ev = parse_event(json::parse(R"({"event":"property-change","id":3,"name":"duration","data":600})"));
    REQUIRE(ev);
    REQUIRE(std::get<DurationChanged>(*ev).seconds == Approx(600.0));
}

TEST_CASE("end of file forms", "[events]") {
    auto ev = parse_event(json::parse(R"({"event":"end-file","reason":"eof"})"));
    REQUIRE(ev);
    REQUIRE(std::get<EndOfFile>(*ev).reason == "eof");

    ev = parse_event(json::parse(R"({"event":"property-change","id":5,"name":"eof-reached","data":true})"));
    REQUIRE(ev);
    REQUIRE(std::holds_alternative<EndOfFile>(*ev));

    REQUIRE_FALSE(parse_event(json::parse(R"({"event":"property-change","id":5,"name":"eof-reached","data":false})")));
}

TEST_CASE("ignored messages", "[events]") {
    REQUIRE_FALSE(parse_event(json::parse(R"({"request_id":3,"error":"success"})")));
    REQUIRE_FALSE(parse_event(json::parse(R"({"event":"playback-restart"})")));
    REQUIRE_FALSE(parse_event(json::parse(R"({"event":"property-change","id":1,"name":"time-pos"})")));
    REQUIRE_FALSE(parse_event(json::parse(R"({"event":"property-change","id":1,"name":"time-pos","data":"soon"})")));
    REQUIRE_FALSE(parse_event(json::array()));
}

TEST_CASE("describe", "[events]") {
    REQUIRE(describe(PlayerEvent{PauseChanged{true}}) == "pause=true");
    REQUIRE(describe(PlayerEvent{ChannelLost{}}) == "channel-lost");
}
