#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// StatusSystem — Render-phase system; draws the StatusPanel overlay.
//
// No Register() — no lifecycle hooks.
// Toggle visibility with F3.
// ---------------------------------------------------------------------------

class StatusSystem {
public:
    static void Update(ecs::World& world, float dt);
};
