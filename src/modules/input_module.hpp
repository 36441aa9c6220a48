#pragma once
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds InputGatherSystem to the Pre-Update phase. Install after the EventBus
// (its flush must come first) and before BoardModule, whose input system
// reads the InputRecord written here.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
    }
};
