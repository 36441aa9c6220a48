#pragma once
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <stdexcept>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises Raylib's audio device and adds AudioSystem (the music stream
// pump) to the Audio phase. A device that fails to come up is fatal: the
// board is useless without output, so install() throws and main() aborts.
//
// Must be installed before CoreModule, whose RaylibAudioBackend needs a live
// device. shutdown() must run after CoreModule::shutdown (all streams
// unloaded) and before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        InitAudioDevice();
        if (!IsAudioDeviceReady()) {
            throw std::runtime_error("AudioModule: audio device failed to initialize");
        }
        pipeline.add_audio([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown() {
        if (IsAudioDeviceReady()) CloseAudioDevice();
    }
};
