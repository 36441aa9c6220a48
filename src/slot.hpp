#pragma once
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Slot model — the eight pads and the document that persists them.
//
// No Raylib dependency; shared by the core library, the window front end and
// the headless test target.
// ---------------------------------------------------------------------------

constexpr int SLOT_COUNT = 8;

enum class AssetType { Music, Icon };

// A file in one of the two asset directories.
struct AssetRef {
    AssetType   type = AssetType::Music;
    std::string name;

    bool operator==(const AssetRef& o) const { return type == o.type && name == o.name; }
    bool operator!=(const AssetRef& o) const { return !(*this == o); }
};

struct Slot {
    int id = 0;
    std::string label;
    std::optional<std::string> filename; // music asset name
    std::optional<std::string> icon;     // icon asset name

    bool operator==(const Slot& o) const {
        return id == o.id && label == o.label && filename == o.filename && icon == o.icon;
    }
    bool operator!=(const Slot& o) const { return !(*this == o); }
};

struct MappingDocument {
    std::vector<Slot> slots;

    // Eight slots in id order, default labels, no references.
    static MappingDocument make_default();

    Slot*       find(int slot_id);
    const Slot* find(int slot_id) const;

    bool operator==(const MappingDocument& o) const { return slots == o.slots; }
    bool operator!=(const MappingDocument& o) const { return !(*this == o); }
};

// Partial update for one slot. An unset outer optional leaves the field alone;
// an engaged outer optional holding nullopt clears the reference.
struct SlotPatch {
    std::optional<std::optional<std::string>> filename;
    std::optional<std::string>                label;
    std::optional<std::optional<std::string>> icon;

    void apply(Slot& slot) const;
};

std::string default_label(int slot_id);

// "music" / "icon"
const char* asset_type_name(AssetType type);

// Accepts "music", "icon" and "icons". Returns nullopt for anything else.
std::optional<AssetType> parse_asset_type(const std::string& s);

// Case-insensitive suffix check against the extensions each type accepts:
// music .mp3 .wav, icons .png .jpg .jpeg .webp
bool accepts_extension(AssetType type, const std::string& filename);

void to_json(nlohmann::json& j, const Slot& slot);
void from_json(const nlohmann::json& j, Slot& slot);
void to_json(nlohmann::json& j, const MappingDocument& doc);
void from_json(const nlohmann::json& j, MappingDocument& doc);
