#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputGatherSystem — Pre-Update; polls Raylib into the InputRecord resource
// (created on first run).
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
