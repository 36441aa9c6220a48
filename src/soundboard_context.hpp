#pragma once
#include "asset_service.hpp"
#include "asset_store.hpp"
#include "audio_backend.hpp"
#include "config.hpp"
#include "mapping_registry.hpp"
#include "playback_controller.hpp"
#include <memory>

// ---------------------------------------------------------------------------
// SoundboardContext — the core objects, wired together.
//
// Stored in the World as std::shared_ptr<SoundboardContext> (the members hold
// mutexes and references to each other, so the context never moves). Members
// are constructed in declaration order: the service refers to all three.
// ---------------------------------------------------------------------------

struct SoundboardContext {
    SoundboardContext(const AppConfig& config, std::unique_ptr<AudioBackend> backend)
        : store(config.music_dir, config.icon_dir),
          registry(config.mapping_path()),
          playback(std::move(backend), store, config.initial_volume),
          service(store, registry, playback) {}

    SoundboardContext(const SoundboardContext&) = delete;
    SoundboardContext& operator=(const SoundboardContext&) = delete;

    AssetStore         store;
    MappingRegistry    registry;
    PlaybackController playback;
    AssetService       service;
};
