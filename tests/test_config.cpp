/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <config.hpp>

#include "test_util.hpp"

#include <fstream>

using namespace hplayer::config;
using hplayer::common::ErrorCode;
using hplayer::test::TempDir;
using hplayer::test::write_file;
using json = nlohmann::json;

static json read_json(const std::string &path) {
    std::ifstream ifs(path);
    json j;
    ifs >> j;
    return j;
}

TEST_CASE("defaults", "[config]") {
    Config c = default_config();
    REQUIRE(c.volume == 100);
    REQUIRE(c.hdmi_output == "auto");
    REQUIRE(c.port == 5000);
    REQUIRE(c.max_upload_size == 2147483648ULL);
    REQUIRE(c.media_dir.size() > std::string("/videos").size());
    REQUIRE(validate_config(c).empty());
}

TEST_CASE("merge skips keys with the wrong type", "[config]") {
    Config c = default_config();
    std::vector<std::string> warnings;
    merge_json(json{{"volume", "loud"}, {"loop", true}, {"port", 6000}}, c, warnings);
    REQUIRE(warnings.size() == 1);
    REQUIRE(c.volume == 100);
    REQUIRE(c.loop);
    REQUIRE(c.port == 6000);
}

TEST_CASE("sanitize replaces invalid fields", "[config]") {
    Config c = default_config();
    c.volume = 400;
    c.hdmi_output = "VGA-1";
    c.log_level = "chatty";
    REQUIRE(validate_config(c).size() == 3);

    std::vector<std::string> warnings;
    sanitize_config(c, warnings);
    REQUIRE(warnings.size() == 3);
    REQUIRE(c.volume == 100);
    REQUIRE(c.hdmi_output == "auto");
    REQUIRE(c.log_level == "info");
}

TEST_CASE("load creates a default file and reads it back", "[config]") {
    TempDir dir;
    const std::string path = dir.file("cfg.json");
    Config c;
    std::vector<std::string> warnings;
    std::string err;
    REQUIRE(load_config(path, c, warnings, err));
    REQUIRE(read_json(path).value("volume", -1) == 100);

    write_file(path, R"({"volume": 40, "hdmi_output": "HDMI-A-1", "media_dir": "/srv/media"})");
    REQUIRE(load_config(path, c, warnings, err));
    REQUIRE(c.volume == 40);
    REQUIRE(c.hdmi_output == "HDMI-A-1");
    REQUIRE(c.media_dir == "/srv/media");

    write_file(path, "{ not json");
    REQUIRE_FALSE(load_config(path, c, warnings, err));
    REQUIRE_FALSE(err.empty());
    REQUIRE(c.volume == 100);
}

TEST_CASE("ConfigStore update is all or nothing", "[config]") {
    TempDir dir;
    const std::string path = dir.file("cfg.json");
    ConfigStore store(path, default_config());
    std::string err;

    REQUIRE(store.update(json::object(), err) == ErrorCode::ValidationError);
    REQUIRE(err == "No configuration data provided");

    REQUIRE(store.update(json{{"volume", 30}, {"hdmi_output", "nowhere"}}, err) == ErrorCode::ValidationError);
    REQUIRE(store.get().volume == 100);

    REQUIRE(store.update(json{{"volume", 30}, {"loop", true}}, err) == ErrorCode::None);
    REQUIRE(store.get().volume == 30);
    REQUIRE(read_json(path).value("loop", false));

    REQUIRE(store.set_volume(55));
    REQUIRE(store.set_output_route("HDMI-A-2"));
    json saved = read_json(path);
    REQUIRE(saved.value("volume", -1) == 55);
    REQUIRE(saved.value("hdmi_output", std::string()) == "HDMI-A-2");
}

TEST_CASE("ConfigStore without a path stays in memory", "[config]") {
    ConfigStore store("", default_config());
    std::string err;
    REQUIRE(store.update(json{{"max_upload_size", 1024}}, err) == ErrorCode::None);
    REQUIRE(store.get().max_upload_size == 1024);
}

TEST_CASE("ConfigStore keeps the old values when the file cannot be written", "[config]") {
    TempDir dir;
    ConfigStore store(dir.file("missing-dir/cfg.json"), default_config());
    std::string err;
    REQUIRE(store.update(json{{"volume", 30}, {"log_level", "debug"}}, err) == ErrorCode::IoError);
    REQUIRE_FALSE(err.empty());
    REQUIRE(store.get().volume == 100);
    REQUIRE(store.get().log_level == "info");
}
