#include "board_input.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../layout.hpp"
#include <raylib.h>
#include <algorithm>
#include <filesystem>

using namespace ecs;
namespace layout = bardbox::layout;

static const int SLOT_KEYS[SLOT_COUNT] = {
    KEY_ONE, KEY_TWO, KEY_THREE, KEY_FOUR, KEY_FIVE, KEY_SIX, KEY_SEVEN, KEY_EIGHT,
};

static void handle_prompt(World& world, const InputRecord& record, TextPrompt& prompt) {
    for (int c : record.typed) prompt.type(c);
    if (record.keys_pressed[KEY_BACKSPACE]) prompt.backspace();

    if (record.keys_pressed[KEY_ESCAPE]) {
        prompt.close();
        return;
    }
    if (!record.keys_pressed[KEY_ENTER] && !record.keys_pressed[KEY_KP_ENTER]) return;

    if (prompt.purpose == TextPrompt::Purpose::RenameAsset) {
        if (!prompt.buffer.empty()) emit(world, RenameAssetEvent{prompt.asset, prompt.buffer});
    } else if (prompt.purpose == TextPrompt::Purpose::RelabelSlot) {
        emit(world, RelabelSlotEvent{prompt.slot_id, prompt.buffer});
    }
    prompt.close();
}

void BoardInputSystem::Update(World& world) {
    auto* record_ptr = world.try_resource<InputRecord>();
    auto* board_ptr  = world.try_resource<BoardState>();
    auto* prompt_ptr = world.try_resource<TextPrompt>();
    if (!record_ptr || !board_ptr || !prompt_ptr) return;
    const auto& record = *record_ptr;
    auto& board  = *board_ptr;
    auto& prompt = *prompt_ptr;

    const float w  = record.screen_w;
    const float h  = record.screen_h;
    const float mx = record.mouse_pos.x;
    const float my = record.mouse_pos.y;

    // 1. Layout
    world.each<SlotPad, PadBounds>([&](Entity, SlotPad& pad, PadBounds& bounds) {
        bounds.rect = layout::pad_rect(pad.slot_id, w, h);
    });
    board.hovered_slot = layout::pad_at(mx, my, w, h);

    // 2. Uploads are accepted even while a prompt is open
    for (const auto& path : record.dropped_files) {
        emit(world, UploadFileEvent{path});
    }

    // 3. Prompt owns the keyboard
    if (prompt.active()) {
        handle_prompt(world, record, prompt);
        return;
    }

    // 4. Keyboard
    for (int i = 0; i < SLOT_COUNT; ++i) {
        if (record.keys_pressed[SLOT_KEYS[i]]) emit(world, PlaySlotEvent{i + 1});
    }
    if (record.keys_pressed[KEY_SPACE]) emit(world, StopEvent{});
    if (record.keys_pressed[KEY_UP])    emit(world, VolumeStepEvent{VOLUME_STEP});
    if (record.keys_pressed[KEY_DOWN])  emit(world, VolumeStepEvent{-VOLUME_STEP});
    if (record.keys_pressed[KEY_ESCAPE]) board.selection.reset();

    if (board.selection) {
        if (record.keys_pressed[KEY_DELETE]) {
            emit(world, DeleteAssetEvent{*board.selection});
        } else if (record.keys_pressed[KEY_F2]) {
            const std::string stem = std::filesystem::path(board.selection->name).stem().string();
            prompt.open_rename(*board.selection, stem);
            return; // the F2 frame's typed characters belong to nobody
        }
    }

    if (record.keys_pressed[KEY_E] && board.hovered_slot != 0) {
        const Slot* slot = board.catalog.mappings.find(board.hovered_slot);
        prompt.open_relabel(board.hovered_slot, slot ? slot->label : default_label(board.hovered_slot));
        return;
    }

    // 5. Library scrolling
    if (record.mouse_wheel != 0.0f && layout::library_rect(w, h).contains(mx, my)) {
        const int max_scroll = std::max(0, layout::library_row_count(board.catalog) -
                                           layout::library_visible_rows(h));
        board.library_scroll -= static_cast<int>(record.mouse_wheel);
        board.library_scroll = std::clamp(board.library_scroll, 0, max_scroll);
    }

    // 6. Mouse
    if (record.mouse_buttons_pressed[MOUSE_BUTTON_LEFT]) {
        if (board.hovered_slot != 0) {
            if (board.selection) {
                emit(world, MapAssetEvent{board.hovered_slot, *board.selection});
                board.selection.reset();
            } else {
                emit(world, PlaySlotEvent{board.hovered_slot});
            }
        } else if (auto hit = layout::library_at(board.catalog, board.library_scroll, mx, my, w, h)) {
            if (board.selection == hit) board.selection.reset();
            else                        board.selection = hit;
        }
    }
    if (record.mouse_buttons_pressed[MOUSE_BUTTON_RIGHT] && board.hovered_slot != 0) {
        emit(world, UnmapSlotEvent{board.hovered_slot});
    }
}
