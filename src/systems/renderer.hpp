#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render phase.
//
// Update() opens the frame and draws the board, the library panel, the
// status line and any open prompt. Present() closes the frame and must be
// the last render step, after overlays such as StatusSystem.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
