#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    // 1. Keyboard
    for (int i = 0; i < 512; i++) {
        input.keys_pressed[i] = IsKeyPressed(i);
    }
    input.typed.clear();
    for (int c = GetCharPressed(); c != 0; c = GetCharPressed()) {
        input.typed.push_back(c);
    }

    // 2. Mouse
    input.mouse_pos = GetMousePosition();
    input.mouse_wheel = GetMouseWheelMove();
    for (int i = 0; i < 8; i++) {
        input.mouse_buttons_pressed[i] = IsMouseButtonPressed(i);
    }

    // 3. Dropped files
    input.dropped_files.clear();
    if (IsFileDropped()) {
        FilePathList dropped = LoadDroppedFiles();
        for (unsigned int i = 0; i < dropped.count; i++) {
            input.dropped_files.emplace_back(dropped.paths[i]);
        }
        UnloadDroppedFiles(dropped);
    }

    // 4. Window
    input.screen_w = static_cast<float>(GetScreenWidth());
    input.screen_h = static_cast<float>(GetScreenHeight());
}
