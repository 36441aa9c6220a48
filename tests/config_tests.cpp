#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/config.hpp"
#include <raylib.h>

TEST_CASE("Config — defaults", "[config]") {
    AppConfig cfg;
    CHECK(cfg.data_dir == "data");
    CHECK(cfg.music_dir == "static/music");
    CHECK(cfg.icon_dir == "static/icons");
    CHECK(cfg.mapping_path() == std::filesystem::path("data") / "mappings.json");
    CHECK(cfg.window_width == 1280);
    CHECK(cfg.window_height == 720);
    CHECK(cfg.initial_volume == 1.0f);
    CHECK(cfg.trace_log_level() == LOG_INFO);
}

TEST_CASE("Config — keys override defaults, missing keys keep them", "[config]") {
    AppConfig cfg;
    REQUIRE(ConfigLoader::load_from_string(cfg, R"({
        "data_dir": "/srv/bardbox",
        "mapping_file": "board.json",
        "window_width": 800,
        "title": "Tavern"
    })"));

    CHECK(cfg.data_dir == "/srv/bardbox");
    CHECK(cfg.mapping_path() == std::filesystem::path("/srv/bardbox/board.json"));
    CHECK(cfg.window_width == 800);
    CHECK(cfg.window_height == 720);
    CHECK(cfg.title == "Tavern");
    CHECK(cfg.music_dir == "static/music");
}

TEST_CASE("Config — empty object is valid", "[config]") {
    AppConfig cfg;
    cfg.title = "changed";
    REQUIRE(ConfigLoader::load_from_string(cfg, "{}"));
    CHECK(cfg.title == "BardBox");
}

TEST_CASE("Config — initial volume is clamped", "[config]") {
    AppConfig cfg;
    REQUIRE(ConfigLoader::load_from_string(cfg, R"({"initial_volume": 3.5})"));
    CHECK(cfg.initial_volume == 1.0f);
    REQUIRE(ConfigLoader::load_from_string(cfg, R"({"initial_volume": -1})"));
    CHECK(cfg.initial_volume == 0.0f);
}

TEST_CASE("Config — invalid documents are rejected and leave the config untouched", "[config]") {
    AppConfig cfg;
    cfg.data_dir = "keep";

    CHECK_FALSE(ConfigLoader::load_from_string(cfg, "{ not json"));
    CHECK_FALSE(ConfigLoader::load_from_string(cfg, "[1, 2, 3]"));
    CHECK_FALSE(ConfigLoader::load_from_string(cfg, R"({"window_width": "wide"})"));
    CHECK_FALSE(ConfigLoader::load_from_string(cfg, R"({"window_height": 0})"));
    CHECK_FALSE(ConfigLoader::load_from_string(cfg, R"({"data_dir": "elsewhere", "window_width": -5})"));

    CHECK(cfg.data_dir == "keep");
}

TEST_CASE("Config — log level names", "[config]") {
    AppConfig cfg;
    cfg.log_level = "debug";   CHECK(cfg.trace_log_level() == LOG_DEBUG);
    cfg.log_level = "warning"; CHECK(cfg.trace_log_level() == LOG_WARNING);
    cfg.log_level = "error";   CHECK(cfg.trace_log_level() == LOG_ERROR);
    cfg.log_level = "none";    CHECK(cfg.trace_log_level() == LOG_NONE);
    cfg.log_level = "loud";    CHECK(cfg.trace_log_level() == LOG_INFO);
}

TEST_CASE("Config — load reads from disk", "[config]") {
    TempDir tmp;
    AppConfig cfg;

    CHECK_FALSE(ConfigLoader::load(cfg, (tmp / "absent.json").string()));

    write_file(tmp / "bardbox.json", R"({"music_dir": "sounds"})");
    REQUIRE(ConfigLoader::load(cfg, (tmp / "bardbox.json").string()));
    CHECK(cfg.music_dir == "sounds");
}
