#pragma once
#include "asset_service.hpp"
#include "slot.hpp"
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Board components and resources. No Raylib dependency; the board input and
// command systems are exercised headless in the test target.
// ---------------------------------------------------------------------------

struct Rect {
    float x = 0, y = 0, w = 0, h = 0;

    bool contains(float px, float py) const {
        return px >= x && px < x + w && py >= y && py < y + h;
    }
};

// One per slot entity.
struct SlotPad {
    int slot_id = 0;
};

// Screen rectangle of a pad, refreshed from the window size every frame.
struct PadBounds {
    Rect rect;
};

// ---------------------------------------------------------------------------
// BoardState — World resource shared by input, commands and rendering.
// ---------------------------------------------------------------------------

struct BoardState {
    Catalog catalog;
    bool    catalog_dirty = true; // CommandSystem reloads when set

    std::optional<AssetRef> selection; // library entry picked for mapping
    int hovered_slot   = 0;            // 0 = none
    int library_scroll = 0;            // rows scrolled off the top

    std::string status;                // last user-facing message
    bool        status_is_error = false;

    void report(std::string message, bool error = false) {
        status          = std::move(message);
        status_is_error = error;
    }
};

// ---------------------------------------------------------------------------
// TextPrompt — single-line inline editor for renames and labels.
//
// While open it swallows all keyboard input except file drops.
// ---------------------------------------------------------------------------

struct TextPrompt {
    enum class Purpose { None, RenameAsset, RelabelSlot };

    static constexpr size_t MAX_LENGTH = 64;

    Purpose     purpose = Purpose::None;
    std::string buffer;
    AssetRef    asset;       // RenameAsset target
    int         slot_id = 0; // RelabelSlot target

    bool active() const { return purpose != Purpose::None; }

    void open_rename(const AssetRef& ref, std::string initial) {
        purpose = Purpose::RenameAsset;
        asset   = ref;
        slot_id = 0;
        buffer  = std::move(initial);
    }

    void open_relabel(int slot, std::string initial) {
        purpose = Purpose::RelabelSlot;
        asset   = {};
        slot_id = slot;
        buffer  = std::move(initial);
    }

    void close() {
        purpose = Purpose::None;
        buffer.clear();
        asset   = {};
        slot_id = 0;
    }

    // Printable ASCII only.
    void type(int codepoint) {
        if (codepoint < 32 || codepoint > 126) return;
        if (buffer.size() >= MAX_LENGTH) return;
        buffer.push_back(static_cast<char>(codepoint));
    }

    void backspace() {
        if (!buffer.empty()) buffer.pop_back();
    }
};
