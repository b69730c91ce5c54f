/*
* @license
* (C) zachbabanov
*
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <common.hpp>
#include <logger.hpp>

#include <regex>

using namespace hplayer::common;
using namespace hplayer::log;

TEST_CASE("error_name covers the taxonomy", "[common]") {
    REQUIRE(std::string(error_name(ErrorCode::None)) == "None");
    REQUIRE(std::string(error_name(ErrorCode::InvalidFilename)) == "InvalidFilename");
    REQUIRE(std::string(error_name(ErrorCode::ChannelTimeout)) == "ChannelTimeout");
    REQUIRE(std::string(error_name(ErrorCode::Busy)) == "Busy");
    REQUIRE(std::string(error_name(ErrorCode::IoError)) == "IoError");
}

TEST_CASE("error classification", "[common]") {
    REQUIRE(is_validation_error(ErrorCode::ValidationError));
    REQUIRE(is_validation_error(ErrorCode::InvalidFilename));
    REQUIRE_FALSE(is_validation_error(ErrorCode::SpawnError));

    REQUIRE(is_transient_channel_error(ErrorCode::ChannelTimeout));
    REQUIRE(is_transient_channel_error(ErrorCode::ChannelClosed));
    REQUIRE_FALSE(is_transient_channel_error(ErrorCode::CommandRejected));
    REQUIRE_FALSE(is_transient_channel_error(ErrorCode::ChannelUnavailable));
}

TEST_CASE("parse_level accepts any case", "[common][logger]") {
    Level l = Level::INFO;
    REQUIRE(parse_level("DEBUG", l));
    REQUIRE(l == Level::DEBUG);
    REQUIRE(parse_level("Warning", l));
    REQUIRE(l == Level::WARN);
    REQUIRE(parse_level("error", l));
    REQUIRE(l == Level::ERROR);
    REQUIRE(std::string(level_name(l)) == "error");

    l = Level::INFO;
    REQUIRE_FALSE(parse_level("loud", l));
    REQUIRE(l == Level::INFO);
}

TEST_CASE("iso_time layout", "[common]") {
    std::string t = iso_time(0);
    REQUIRE(std::regex_match(t, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})")));
    REQUIRE(iso_time_now().size() == 19);
}
