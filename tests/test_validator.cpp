/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <validator.hpp>

#include "test_util.hpp"

#include <unistd.h>

using namespace hplayer::validator;
using namespace hplayer::common;
using hplayer::test::TempDir;
using hplayer::test::write_file;
using json = nlohmann::json;

TEST_CASE("volume bounds and integral values", "[validator]") {
    TempDir dir;
    Validator v(dir.path());

    REQUIRE(v.volume(0).ok());
    REQUIRE(v.volume(150).ok());
    REQUIRE(v.volume(150).command->volume() == 150);
    REQUIRE(v.volume("75").command->volume() == 75);

    auto r = v.volume(151);
    REQUIRE(r.code == ErrorCode::ValidationError);
    REQUIRE(r.message == "Volume must be between 0 and 150, got 151");
    REQUIRE_FALSE(r.command);

    REQUIRE(v.volume(-1).code == ErrorCode::ValidationError);
    REQUIRE(v.volume("loud").message == "Invalid volume value: loud");
    REQUIRE(v.volume(50.5).code == ErrorCode::ValidationError);
    REQUIRE(v.volume(json()).message == "Invalid volume value: null");
}

TEST_CASE("seek and skip ranges", "[validator]") {
    TempDir dir;
    Validator v(dir.path());

    REQUIRE(v.seek(0).ok());
    REQUIRE(v.seek(86400).ok());
    REQUIRE(v.seek("12.5").command->seconds() == Approx(12.5));
    REQUIRE(v.seek(-0.5).code == ErrorCode::ValidationError);
    REQUIRE(v.seek(86401).message == "Seek position must be between 0 and 86400, got 86401");
    REQUIRE(v.seek("12abc").message == "Invalid seek position: 12abc");
    REQUIRE(v.seek("nan").code == ErrorCode::ValidationError);

    REQUIRE(v.skip(-3600).ok());
    REQUIRE(v.skip(3600).ok());
    REQUIRE(v.skip("-10").command->seconds() == Approx(-10.0));
    REQUIRE(v.skip(3601).code == ErrorCode::ValidationError);
    REQUIRE(v.skip("").code == ErrorCode::ValidationError);
}

TEST_CASE("output route must be a known connector", "[validator]") {
    TempDir dir;
    Validator v(dir.path());

    REQUIRE(v.output_route("auto").ok());
    REQUIRE(v.output_route("HDMI-A-2").command->route() == "HDMI-A-2");
    auto r = v.output_route("HDMI-A-3");
    REQUIRE(r.code == ErrorCode::ValidationError);
    REQUIRE(r.message == "Invalid HDMI output: HDMI-A-3. Must be one of [auto, HDMI-A-1, HDMI-A-2]");
    REQUIRE_FALSE(v.output_route(1).ok());
}

TEST_CASE("parameterless commands", "[validator]") {
    TempDir dir;
    Validator v(dir.path());
    REQUIRE(v.simple(CommandKind::Pause).command->kind() == CommandKind::Pause);
    REQUIRE(v.simple(CommandKind::Stop).ok());
    REQUIRE_FALSE(v.simple(CommandKind::Seek).ok());
}

TEST_CASE("filenames are confined to the media directory", "[validator][filename]") {
    TempDir dir;
    std::string normalized, resolved, msg;

    SECTION("traversal") {
        REQUIRE(check_filename(dir.path(), "../etc/passwd.mp4", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(msg == "Path traversal attempt detected");
        REQUIRE(check_filename(dir.path(), "sub/clip.mp4", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(check_filename(dir.path(), "a\\b.mp4", normalized, resolved, msg) == ErrorCode::InvalidFilename);
    }
    SECTION("hidden and empty") {
        REQUIRE(check_filename(dir.path(), ".hidden.mp4", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(check_filename(dir.path(), "   ", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(msg == "Filename cannot be empty");
    }
    SECTION("extension allow list") {
        REQUIRE(check_filename(dir.path(), "tool.exe", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(msg.rfind("File type .exe not allowed.", 0) == 0);
        REQUIRE(check_filename(dir.path(), "CLIP.MKV", normalized, resolved, msg) == ErrorCode::None);
        REQUIRE(has_allowed_extension("a.webm"));
        REQUIRE_FALSE(has_allowed_extension("mp4"));
    }
    SECTION("spaces are normalized") {
        REQUIRE(check_filename(dir.path(), "  my movie.mp4 ", normalized, resolved, msg) == ErrorCode::None);
        REQUIRE(normalized == "my_movie.mp4");
        REQUIRE(resolved == dir.file("my_movie.mp4"));
    }
    SECTION("symlink leaving the directory") {
        TempDir outside;
        write_file(outside.file("real.mp4"), "x");
        REQUIRE(::symlink(outside.file("real.mp4").c_str(), dir.file("link.mp4").c_str()) == 0);
        REQUIRE(check_filename(dir.path(), "link.mp4", normalized, resolved, msg) == ErrorCode::InvalidFilename);
        REQUIRE(msg == "Path traversal attempt detected");
    }
}

TEST_CASE("play requires an existing file", "[validator]") {
    TempDir dir;
    Validator v(dir.path());

    auto missing = v.play("nothere.mp4");
    REQUIRE(missing.code == ErrorCode::ValidationError);
    REQUIRE(missing.message == "File not found: nothere.mp4");

    write_file(dir.file("clip.mp4"), "data");
    auto ok = v.play("clip.mp4");
    REQUIRE(ok.ok());
    REQUIRE(ok.command->kind() == CommandKind::Play);
    REQUIRE(ok.command->media() == "clip.mp4");
    REQUIRE(ok.command->path() == dir.file("clip.mp4"));

    REQUIRE(v.play(json()).code == ErrorCode::InvalidFilename);
}
