#include "slot.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::optional<std::string> parse_ref(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

static json ref_to_json(const std::optional<std::string>& ref) {
    return ref ? json(*ref) : json(nullptr);
}

// ---------------------------------------------------------------------------
// Model
// ---------------------------------------------------------------------------

std::string default_label(int slot_id) {
    return "Slot " + std::to_string(slot_id);
}

MappingDocument MappingDocument::make_default() {
    MappingDocument doc;
    doc.slots.reserve(SLOT_COUNT);
    for (int id = 1; id <= SLOT_COUNT; ++id) {
        doc.slots.push_back(Slot{id, default_label(id), std::nullopt, std::nullopt});
    }
    return doc;
}

Slot* MappingDocument::find(int slot_id) {
    for (auto& s : slots) {
        if (s.id == slot_id) return &s;
    }
    return nullptr;
}

const Slot* MappingDocument::find(int slot_id) const {
    for (const auto& s : slots) {
        if (s.id == slot_id) return &s;
    }
    return nullptr;
}

void SlotPatch::apply(Slot& slot) const {
    if (filename) slot.filename = *filename;
    if (label)    slot.label    = *label;
    if (icon)     slot.icon     = *icon;
}

const char* asset_type_name(AssetType type) {
    return type == AssetType::Music ? "music" : "icon";
}

std::optional<AssetType> parse_asset_type(const std::string& s) {
    if (s == "music")                return AssetType::Music;
    if (s == "icon" || s == "icons") return AssetType::Icon;
    return std::nullopt;
}

bool accepts_extension(AssetType type, const std::string& filename) {
    const std::string ext = to_lower(std::filesystem::path(filename).extension().string());
    if (type == AssetType::Music) {
        return ext == ".mp3" || ext == ".wav";
    }
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".webp";
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

void to_json(json& j, const Slot& slot) {
    j = json{
        {"id",       slot.id},
        {"label",    slot.label},
        {"filename", ref_to_json(slot.filename)},
        {"icon",     ref_to_json(slot.icon)},
    };
}

void from_json(const json& j, Slot& slot) {
    slot.id       = j.at("id").get<int>();
    slot.label    = j.value("label", default_label(slot.id));
    slot.filename = parse_ref(j, "filename");
    slot.icon     = parse_ref(j, "icon");
}

void to_json(json& j, const MappingDocument& doc) {
    j = json{{"slots", doc.slots}};
}

void from_json(const json& j, MappingDocument& doc) {
    doc.slots = j.at("slots").get<std::vector<Slot>>();
}
