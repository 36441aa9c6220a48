#pragma once
#include "../pipeline.hpp"
#include "../status_panel.hpp"
#include "../systems/status.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// StatusModule
//
// install() creates the StatusPanel world resource with the Engine rows
// (FPS, Frame Time). It must run BEFORE any module that adds its own rows.
//
// install_overlay() adds StatusSystem to the Render phase. Call it after
// RenderModule::install and before RenderModule::install_present so the
// overlay lands on top of the board inside the same frame.
// ---------------------------------------------------------------------------

struct StatusModule {
    static void install(ecs::World& world, ecs::Pipeline& /*pipeline*/) {
        StatusPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });

        world.set_resource(std::move(panel));
    }

    static void install_overlay(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { StatusSystem::Update(w, dt); });
    }
};
