#pragma once
#include "components.hpp"
#include "slot.hpp"
#include <optional>

namespace bardbox::layout {

constexpr float MARGIN    = 16.0f;
constexpr float HEADER_H  = 72.0f;  // title + key help
constexpr float FOOTER_H  = 40.0f;  // status line + volume
constexpr float LIBRARY_W = 320.0f;
constexpr float ROW_H     = 22.0f;
constexpr int   COLUMNS   = 4;
constexpr int   ROWS      = 2;

/**
 * @brief Screen rectangle of a pad. Slots fill a 4x2 grid left to right,
 * top to bottom, to the left of the library panel.
 */
inline Rect pad_rect(int slot_id, float screen_w, float screen_h) {
    const float board_w = screen_w - LIBRARY_W - 2.0f * MARGIN;
    const float board_h = screen_h - HEADER_H - FOOTER_H - MARGIN;
    const float cell_w  = board_w / COLUMNS;
    const float cell_h  = board_h / ROWS;
    const int   index   = slot_id - 1;
    const int   col     = index % COLUMNS;
    const int   row     = index / COLUMNS;
    return {MARGIN + col * cell_w + MARGIN * 0.5f,
            HEADER_H + row * cell_h + MARGIN * 0.5f,
            cell_w - MARGIN,
            cell_h - MARGIN};
}

/**
 * @brief Slot id under a point, or 0.
 */
inline int pad_at(float x, float y, float screen_w, float screen_h) {
    for (int id = 1; id <= SLOT_COUNT; ++id) {
        if (pad_rect(id, screen_w, screen_h).contains(x, y)) return id;
    }
    return 0;
}

inline Rect library_rect(float screen_w, float screen_h) {
    return {screen_w - LIBRARY_W, HEADER_H, LIBRARY_W - MARGIN, screen_h - HEADER_H - FOOTER_H};
}

/**
 * @brief Number of library rows that fit on screen.
 */
inline int library_visible_rows(float screen_h) {
    const int rows = static_cast<int>((screen_h - HEADER_H - FOOTER_H) / ROW_H);
    return rows > 0 ? rows : 0;
}

/**
 * @brief Total library rows: a header row per section plus one per entry.
 */
inline int library_row_count(const Catalog& catalog) {
    return 2 + static_cast<int>(catalog.music.size() + catalog.icons.size());
}

/**
 * @brief What a library row shows. Row 0 is the MUSIC header, followed by the
 * music entries, the ICONS header and the icon entries.
 * @return nullopt for header rows and rows past the end.
 */
inline std::optional<AssetRef> library_entry(const Catalog& catalog, int row) {
    const int music = static_cast<int>(catalog.music.size());
    const int icons = static_cast<int>(catalog.icons.size());
    if (row >= 1 && row <= music) {
        return AssetRef{AssetType::Music, catalog.music[row - 1]};
    }
    const int icon_row = row - music - 2;
    if (icon_row >= 0 && icon_row < icons) {
        return AssetRef{AssetType::Icon, catalog.icons[icon_row]};
    }
    return std::nullopt;
}

/**
 * @brief Library entry under a point, honouring the scroll offset.
 */
inline std::optional<AssetRef> library_at(const Catalog& catalog, int scroll,
                                          float x, float y,
                                          float screen_w, float screen_h) {
    const Rect panel = library_rect(screen_w, screen_h);
    if (!panel.contains(x, y)) return std::nullopt;
    const int row = static_cast<int>((y - panel.y) / ROW_H) + scroll;
    return library_entry(catalog, row);
}

} // namespace bardbox::layout
