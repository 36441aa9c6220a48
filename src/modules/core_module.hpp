#pragma once
#include "../config.hpp"
#include "../errors.hpp"
#include "../playback_controller.hpp"
#include "../raylib_audio_backend.hpp"
#include "../soundboard_context.hpp"
#include "../status_panel.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

// ---------------------------------------------------------------------------
// CoreModule
//
// Creates the data, music and icon directories, builds the SoundboardContext
// around a RaylibAudioBackend and stores it as a world resource
// (std::shared_ptr<SoundboardContext>). Loads the mapping document once so a
// missing file is created now; StorageUnavailable here aborts startup.
//
// Adds "Playback" status rows when a StatusPanel exists.
// ---------------------------------------------------------------------------

struct CoreModule {
    static void install(ecs::World& world, const AppConfig& config) {
        std::error_code ec;
        std::filesystem::create_directories(config.data_dir, ec);
        if (ec) {
            throw StorageUnavailable("CoreModule: cannot create '" + config.data_dir + "': " + ec.message());
        }

        auto ctx = std::make_shared<SoundboardContext>(config, std::make_unique<RaylibAudioBackend>());
        ctx->store.ensure_directories();
        ctx->registry.load();
        world.set_resource(ctx);

        if (auto* panel = world.try_resource<StatusPanel>()) {
            std::weak_ptr<SoundboardContext> weak = ctx;
            panel->watch("Playback", "State", [weak]() {
                auto c = weak.lock();
                if (!c) return std::string("-");
                return c->playback.state() == PlaybackController::State::Playing
                    ? std::string("Playing") : std::string("Stopped");
            });
            panel->watch("Playback", "Track", [weak]() {
                auto c = weak.lock();
                if (!c) return std::string("-");
                return c->playback.track().value_or("-");
            });
            panel->watch("Playback", "Volume", [weak]() {
                auto c = weak.lock();
                if (!c) return std::string("-");
                char b[16];
                std::snprintf(b, sizeof(b), "%.2f", c->playback.volume());
                return std::string(b);
            });
        }
    }

    // Releases the audio stream; must run before AudioModule::shutdown().
    static void shutdown(ecs::World& world) {
        if (auto* ctx = world.try_resource<std::shared_ptr<SoundboardContext>>()) {
            if (*ctx) (*ctx)->playback.unload();
            ctx->reset();
        }
    }
};
