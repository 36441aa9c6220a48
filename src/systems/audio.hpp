#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — Audio phase; refills the playing music stream.
//
// Raylib streams need UpdateMusicStream() every frame; a looping track
// restarts from inside that call.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Update(ecs::World& world, float dt);
};
