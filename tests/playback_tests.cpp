#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "test_support.hpp"
#include "../src/asset_store.hpp"
#include "../src/errors.hpp"
#include "../src/playback_controller.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

struct Deck {
    TempDir                       tmp;
    std::shared_ptr<FakeAudioLog> audio = std::make_shared<FakeAudioLog>();
    AssetStore                    store{tmp / "music", tmp / "icons"};
    PlaybackController            playback{std::make_unique<FakeAudioBackend>(audio), store, 0.8f};

    Deck() {
        store.ensure_directories();
        write_file(store.path(AssetType::Music, "a.mp3"));
        write_file(store.path(AssetType::Music, "b.wav"));
    }
};

TEST_CASE("Playback — starts Stopped with the initial volume applied", "[playback]") {
    Deck d;
    CHECK(d.playback.state() == PlaybackController::State::Stopped);
    CHECK_FALSE(d.playback.track());
    CHECK_THAT(d.playback.volume(), Catch::Matchers::WithinAbs(0.8f, 1e-6f));
    CHECK_THAT(d.audio->volume,     Catch::Matchers::WithinAbs(0.8f, 1e-6f));
}

TEST_CASE("Playback — play loads and starts the track", "[playback]") {
    Deck d;
    d.playback.play("a.mp3");

    CHECK(d.playback.state() == PlaybackController::State::Playing);
    CHECK(d.playback.track() == std::string("a.mp3"));
    REQUIRE(d.audio->calls.size() == 2);
    CHECK(d.audio->calls[0] == "load a.mp3");
    CHECK(d.audio->calls[1] == "play");
}

TEST_CASE("Playback — a second play replaces the first track", "[playback]") {
    Deck d;
    d.playback.play("a.mp3");
    d.playback.play("b.wav");

    CHECK(d.playback.state() == PlaybackController::State::Playing);
    CHECK(d.playback.track() == std::string("b.wav"));
    CHECK(std::filesystem::path(d.audio->loaded).filename() == "b.wav");
}

TEST_CASE("Playback — missing file is AssetNotFound and state is unchanged", "[playback]") {
    Deck d;

    SECTION("from Stopped") {
        CHECK_THROWS_AS(d.playback.play("missing.mp3"), AssetNotFound);
        CHECK(d.playback.state() == PlaybackController::State::Stopped);
        CHECK_FALSE(d.playback.track());
        CHECK(d.audio->calls.empty());
    }

    SECTION("from Playing") {
        d.playback.play("a.mp3");
        CHECK_THROWS_AS(d.playback.play("missing.mp3"), AssetNotFound);
        CHECK(d.playback.state() == PlaybackController::State::Playing);
        CHECK(d.playback.track() == std::string("a.mp3"));
    }
}

TEST_CASE("Playback — undecodable file is AssetNotFound and state is unchanged", "[playback]") {
    Deck d;
    d.playback.play("a.mp3");
    d.audio->fail_loads = true;

    CHECK_THROWS_AS(d.playback.play("b.wav"), AssetNotFound);
    CHECK(d.playback.state() == PlaybackController::State::Playing);
    CHECK(d.playback.track() == std::string("a.mp3"));
}

TEST_CASE("Playback — stop is idempotent", "[playback]") {
    Deck d;
    d.playback.play("a.mp3");
    d.playback.stop();
    d.playback.stop();

    CHECK(d.playback.state() == PlaybackController::State::Stopped);
    int stops = 0;
    for (const auto& c : d.audio->calls) if (c == "stop") ++stops;
    CHECK(stops == 1);
}

TEST_CASE("Playback — set_volume clamps and returns the applied level", "[playback]") {
    Deck d;
    CHECK(d.playback.set_volume(1.7f)  == 1.0f);
    CHECK(d.playback.set_volume(-0.3f) == 0.0f);
    CHECK_THAT(d.playback.set_volume(0.25f), Catch::Matchers::WithinAbs(0.25f, 1e-6f));
    CHECK(d.playback.set_volume(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
    CHECK(d.audio->volume == 0.0f);
}

TEST_CASE("Playback — volume survives a track change and does not change state", "[playback]") {
    Deck d;
    d.playback.set_volume(0.3f);
    CHECK(d.playback.state() == PlaybackController::State::Stopped);

    d.playback.play("a.mp3");
    CHECK_THAT(d.audio->volume, Catch::Matchers::WithinAbs(0.3f, 1e-6f));
}

TEST_CASE("Playback — unload releases the stream and stops", "[playback]") {
    Deck d;
    d.playback.play("a.mp3");
    d.playback.unload();

    CHECK(d.playback.state() == PlaybackController::State::Stopped);
    CHECK_FALSE(d.playback.track());
    CHECK(d.audio->loaded.empty());
}

TEST_CASE("Playback — update only pumps while playing", "[playback]") {
    Deck d;
    d.playback.update();
    CHECK(d.audio->updates == 0);

    d.playback.play("a.mp3");
    d.playback.update();
    d.playback.update();
    CHECK(d.audio->updates == 2);

    d.playback.stop();
    d.playback.update();
    CHECK(d.audio->updates == 2);
}

TEST_CASE("Playback — concurrent plays settle on one of the tracks", "[playback]") {
    Deck d;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&d, i]() { d.playback.play(i % 2 ? "a.mp3" : "b.wav"); });
    }
    for (auto& t : threads) t.join();

    const auto track = d.playback.track();
    REQUIRE(track);
    CHECK((*track == "a.mp3" || *track == "b.wav"));
    CHECK(std::filesystem::path(d.audio->loaded).filename() == *track);
}
