#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// BoardInputSystem — Pre-Update; turns the InputRecord into board events.
//
//   1-8 / LMB on pad   play the slot (or map the selected asset into it)
//   RMB on pad         unmap
//   LMB on library     select / deselect an asset
//   SPACE              stop
//   UP / DOWN          volume +/- 0.1
//   DELETE             delete the selected asset
//   F2                 rename the selected asset (prompt)
//   E                  relabel the hovered pad (prompt)
//   ESCAPE             drop the selection, or cancel the prompt
//   file drop          upload
//
// Also refreshes PadBounds from the window size. Reads only the InputRecord,
// so tests drive it with hand-built records.
// ---------------------------------------------------------------------------

class BoardInputSystem {
public:
    static constexpr float VOLUME_STEP = 0.1f;

    static void Update(ecs::World& world);
};
