#include "renderer.hpp"
#include "../components.hpp"
#include "../icon_cache.hpp"
#include "../layout.hpp"
#include "../soundboard_context.hpp"
#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>

using namespace ecs;
namespace layout = bardbox::layout;

static constexpr Color C_BACKGROUND = {30, 30, 36, 255};
static constexpr Color C_PAD        = {52, 52, 62, 255};
static constexpr Color C_PAD_HOVER  = {68, 68, 82, 255};
static constexpr Color C_PAD_PLAY   = {40, 110, 70, 255};
static constexpr Color C_BORDER     = {90, 90, 104, 255};
static constexpr Color C_SELECTED   = {210, 190, 80, 255};
static constexpr Color C_TEXT       = {235, 235, 235, 255};
static constexpr Color C_DIM        = {150, 150, 160, 255};
static constexpr Color C_ERROR      = {230, 90, 80, 255};

static inline Rectangle to_raylib(const Rect& r) {
    return Rectangle{r.x, r.y, r.w, r.h};
}

// Trims text with a trailing ".." until it fits max_w pixels.
static std::string fit_text(const std::string& text, int font, float max_w) {
    if (MeasureText(text.c_str(), font) <= max_w) return text;
    std::string s = text;
    while (!s.empty() && MeasureText((s + "..").c_str(), font) > max_w) s.pop_back();
    return s + "..";
}

static void draw_pad(const Slot& slot, const Rect& r, bool hovered, bool playing,
                     IconCache* icons, const AssetStore& store) {
    const Color fill = playing ? C_PAD_PLAY : (hovered ? C_PAD_HOVER : C_PAD);
    DrawRectangleRec(to_raylib(r), fill);
    DrawRectangleLinesEx(to_raylib(r), hovered ? 2.0f : 1.0f, C_BORDER);

    // Icon fills the area above the two text lines, aspect preserved.
    const float text_h = 44.0f;
    const Rect  art    = {r.x + 10, r.y + 10, r.w - 20, r.h - text_h - 20};
    const Texture2D* tex = (icons && slot.icon) ? icons->get(store, *slot.icon) : nullptr;
    if (tex && art.w > 0 && art.h > 0) {
        const float scale = std::min(art.w / tex->width, art.h / tex->height);
        const float dw = tex->width * scale;
        const float dh = tex->height * scale;
        DrawTexturePro(*tex, {0, 0, (float)tex->width, (float)tex->height},
                       {art.x + (art.w - dw) * 0.5f, art.y + (art.h - dh) * 0.5f, dw, dh},
                       {0, 0}, 0.0f, WHITE);
    } else {
        const std::string num = std::to_string(slot.id);
        DrawText(num.c_str(), (int)(art.x + art.w * 0.5f - MeasureText(num.c_str(), 40) * 0.5f),
                 (int)(art.y + art.h * 0.5f - 20), 40, C_BORDER);
    }

    const int tx = (int)r.x + 10;
    const int ty = (int)(r.y + r.h - text_h);
    DrawText(fit_text(slot.label, 20, r.w - 20).c_str(), tx, ty, 20, C_TEXT);
    const std::string track = slot.filename ? *slot.filename : std::string("(no track)");
    DrawText(fit_text(track, 10, r.w - 20).c_str(), tx, ty + 24, 10, C_DIM);
}

static void draw_library(const BoardState& board, float w, float h) {
    const Rect panel = layout::library_rect(w, h);
    DrawRectangleRec(to_raylib(panel), {38, 38, 46, 255});
    DrawRectangleLinesEx(to_raylib(panel), 1.0f, C_BORDER);

    const int visible = layout::library_visible_rows(h);
    const int total   = layout::library_row_count(board.catalog);
    const int music   = static_cast<int>(board.catalog.music.size());

    for (int i = 0; i < visible; ++i) {
        const int row = i + board.library_scroll;
        if (row >= total) break;
        const int y = (int)(panel.y + i * layout::ROW_H + 4);
        const int x = (int)panel.x + 8;

        if (row == 0 || row == music + 1) {
            DrawText(row == 0 ? "MUSIC" : "ICONS", x, y, 10, C_SELECTED);
            continue;
        }
        const auto entry = layout::library_entry(board.catalog, row);
        if (!entry) continue;
        const bool selected = board.selection && *board.selection == *entry;
        if (selected) {
            DrawRectangle((int)panel.x + 2, y - 3, (int)panel.w - 4, (int)layout::ROW_H - 2, {70, 64, 34, 255});
        }
        DrawText(fit_text(entry->name, 10, panel.w - 24).c_str(), x + 8, y, 10, selected ? C_SELECTED : C_TEXT);
    }
}

static void draw_footer(const BoardState& board, const PlaybackController& playback, float w, float h) {
    const int y = (int)(h - layout::FOOTER_H + 12);
    DrawText(fit_text(board.status, 20, w - 260).c_str(), (int)layout::MARGIN, y, 20,
             board.status_is_error ? C_ERROR : C_DIM);

    // Volume bar
    const float vol = playback.volume();
    const Rect bar = {w - 220, (float)y + 4, 200, 12};
    DrawRectangleRec(to_raylib(bar), C_PAD);
    DrawRectangleRec({bar.x, bar.y, bar.w * vol, bar.h}, C_PAD_PLAY);
    DrawRectangleLinesEx(to_raylib(bar), 1.0f, C_BORDER);
    char b[16];
    std::snprintf(b, sizeof(b), "%d%%", static_cast<int>(vol * 100.0f + 0.5f));
    DrawText(b, (int)bar.x - MeasureText(b, 10) - 8, (int)bar.y + 1, 10, C_DIM);
}

static void draw_prompt(const TextPrompt& prompt, float w, float h) {
    const std::string title = prompt.purpose == TextPrompt::Purpose::RenameAsset
        ? "Rename " + prompt.asset.name
        : "Label for " + default_label(prompt.slot_id);

    const Rect box = {w * 0.5f - 260, h * 0.5f - 50, 520, 100};
    DrawRectangle(0, 0, (int)w, (int)h, {0, 0, 0, 120});
    DrawRectangleRec(to_raylib(box), {44, 44, 54, 255});
    DrawRectangleLinesEx(to_raylib(box), 2.0f, C_SELECTED);
    DrawText(fit_text(title, 20, box.w - 32).c_str(), (int)box.x + 16, (int)box.y + 14, 20, C_TEXT);

    const bool caret = static_cast<int>(GetTime() * 2.0) % 2 == 0;
    const std::string line = prompt.buffer + (caret ? "_" : " ");
    DrawText(line.c_str(), (int)box.x + 16, (int)box.y + 44, 20, C_SELECTED);
    DrawText("ENTER: Confirm | ESC: Cancel", (int)box.x + 16, (int)box.y + 74, 10, C_DIM);
}

void RenderSystem::Update(World& world) {
    // Always open the frame; Present() closes it unconditionally.
    BeginDrawing();
    ClearBackground(C_BACKGROUND);

    auto* ctx_ptr = world.try_resource<std::shared_ptr<SoundboardContext>>();
    auto* board   = world.try_resource<BoardState>();
    if (!ctx_ptr || !*ctx_ptr || !board) return;
    auto& ctx = **ctx_ptr;

    const float w = static_cast<float>(GetScreenWidth());
    const float h = static_cast<float>(GetScreenHeight());

    // 1. Header
    DrawText("BardBox", (int)layout::MARGIN, 12, 24, C_TEXT);
    DrawText("1-8 / LMB: Play | SPACE: Stop | UP,DOWN: Volume | RMB: Unmap | E: Label | DROP FILES: Upload",
             (int)layout::MARGIN, 42, 10, C_DIM);
    DrawText("Select a file, then click a pad to map it | F2: Rename | DEL: Delete | ESC: Deselect | F3: Status",
             (int)layout::MARGIN, 56, 10, C_DIM);

    // 2. Pads
    const auto state = ctx.playback.state();
    const auto track = ctx.playback.track();
    auto* icons = world.try_resource<IconCache>();

    world.each<SlotPad, PadBounds>([&](Entity, SlotPad& pad, PadBounds& bounds) {
        const Slot* slot = board->catalog.mappings.find(pad.slot_id);
        const Slot shown = slot ? *slot : Slot{pad.slot_id, default_label(pad.slot_id), std::nullopt, std::nullopt};
        const bool playing = state == PlaybackController::State::Playing &&
                             shown.filename && track == shown.filename;
        draw_pad(shown, bounds.rect, board->hovered_slot == pad.slot_id, playing, icons, ctx.store);
    });

    // 3. Library, footer, prompt
    draw_library(*board, w, h);
    draw_footer(*board, ctx.playback, w, h);
    if (auto* prompt = world.try_resource<TextPrompt>(); prompt && prompt->active()) {
        draw_prompt(*prompt, w, h);
    }
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}
