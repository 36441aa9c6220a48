#pragma once
#include "../icon_cache.hpp"
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Creates the IconCache world resource and adds RenderSystem to the Render
// phase. install_present() adds the frame close and must be the last render
// install (after StatusModule::install_overlay).
//
// shutdown() must be called before CloseWindow() to unload GPU textures.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(IconCache{});
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }

    static void shutdown(ecs::World& world) {
        if (auto* icons = world.try_resource<IconCache>()) icons->unload();
    }
};
