#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../status_panel.hpp"
#include "../systems/board_input.hpp"
#include "../systems/commands.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// BoardModule
//
// Spawns one pad entity per slot (SlotPad + PadBounds), creates the
// BoardState and TextPrompt resources and wires BoardInputSystem (Pre-Update,
// after InputGather) and CommandSystem (Logic). Adds "Board" status rows.
//
// Needs EventBusModule; CommandSystem needs CoreModule's context at runtime.
// ---------------------------------------------------------------------------

struct BoardModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        for (int id = 1; id <= SLOT_COUNT; ++id) {
            auto pad = world.create();
            world.add(pad, SlotPad{id});
            world.add(pad, PadBounds{});
        }

        world.set_resource(BoardState{});
        world.set_resource(TextPrompt{});

        pipeline.add_pre_update([](ecs::World& w, float) { BoardInputSystem::Update(w); });
        pipeline.add_logic([](ecs::World& w, float dt) { CommandSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<StatusPanel>()) {
            panel->watch("Board", "Mapped", [&world]() {
                int mapped = 0;
                if (auto* board = world.try_resource<BoardState>()) {
                    for (const auto& s : board->catalog.mappings.slots) {
                        if (s.filename) ++mapped;
                    }
                }
                return std::to_string(mapped) + " / " + std::to_string(SLOT_COUNT);
            });
            panel->watch("Board", "Library", [&world]() {
                auto* board = world.try_resource<BoardState>();
                if (!board) return std::string("-");
                return std::to_string(board->catalog.music.size()) + " music, " +
                       std::to_string(board->catalog.icons.size()) + " icons";
            });
            panel->watch("Board", "Selection", [&world]() {
                auto* board = world.try_resource<BoardState>();
                if (!board || !board->selection) return std::string("-");
                return board->selection->name;
            });
            panel->watch("Board", "Message", [&world]() {
                auto* board = world.try_resource<BoardState>();
                if (!board || board->status.empty()) return std::string("-");
                return board->status;
            });
        }
    }
};
