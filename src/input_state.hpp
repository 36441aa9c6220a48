#pragma once
#include <raylib.h>
#include <string>
#include <vector>

// Snapshot of one frame's input, written by InputGatherSystem. Systems read
// this instead of polling Raylib so they can be driven by hand in tests.
struct InputRecord {
    // Keyboard
    bool keys_pressed[512] = {false};
    std::vector<int> typed;   // codepoints, in order

    // Mouse
    Vector2 mouse_pos = {0, 0};
    float mouse_wheel = 0.0f;
    bool mouse_buttons_pressed[8] = {false};

    // Files dropped on the window this frame
    std::vector<std::string> dropped_files;

    // Window size
    float screen_w = 1280.0f;
    float screen_h = 720.0f;
};
