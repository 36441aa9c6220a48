#pragma once
#include <ecs/ecs.hpp>
#include <string>

class AssetService;
struct BoardState;

// ---------------------------------------------------------------------------
// CommandSystem — Logic phase; consumes the board events and calls into the
// SoundboardContext (service, registry, playback).
//
// Each event is handled on its own: a BardBoxError is logged, reported in
// BoardState::status and does not stop the remaining events. Anything that
// changes the asset listing or the mappings marks the catalog dirty; the
// catalog is reloaded once at the end of the frame and the IconCache (if
// present) is cleared.
// ---------------------------------------------------------------------------

class CommandSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Reads a dropped file and uploads it, choosing music or icon by its
    // extension. Returns the stored name.
    static std::string upload_file(AssetService& service, const std::string& path);
};
