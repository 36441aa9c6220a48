#include "asset_service.hpp"
#include "errors.hpp"
#include <raylib.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

static bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(),
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

AssetService::AssetService(AssetStore& store, MappingRegistry& registry, PlaybackController& playback)
    : store_(store), registry_(registry), playback_(playback) {}

Catalog AssetService::catalog() {
    Catalog c;
    c.mappings = registry_.load();
    c.music    = store_.list(AssetType::Music);
    c.icons    = store_.list(AssetType::Icon);
    return c;
}

std::string AssetService::upload(AssetType type, const std::string& name, const std::string& bytes) {
    const std::string file = fs::path(name).filename().string();
    if (!AssetStore::is_plain_name(file)) {
        throw InvalidRequest("Upload: no file name given");
    }
    if (!accepts_extension(type, file)) {
        throw InvalidRequest("Upload: '" + file + "' is not a valid " + asset_type_name(type) + " file");
    }

    auto guard = locks_.acquire(type, file);
    store_.write(type, file, bytes);
    TraceLog(LOG_INFO, "ASSETS: Uploaded %s: %s", asset_type_name(type), file.c_str());
    return file;
}

std::string AssetService::resolve_rename(const std::string& old_name, const std::string& new_base) {
    const std::string suffix = fs::path(old_name).extension().string();
    return ends_with_ci(new_base, suffix) ? new_base : new_base + suffix;
}

std::string AssetService::rename(AssetType type, const std::string& old_name, const std::string& new_base) {
    const std::string new_name = resolve_rename(old_name, new_base);
    const size_t      suffix   = fs::path(old_name).extension().string().size();
    // An empty base or a leading dot would hide the file from list().
    if (new_name.size() <= suffix || new_name.front() == '.') {
        throw InvalidRequest("Rename: '" + new_base + "' is not a usable name");
    }
    if (!AssetStore::is_plain_name(new_name)) {
        throw InvalidRequest("Rename: invalid name '" + new_name + "'");
    }

    auto guard = locks_.acquire(type, old_name, new_name);
    auto held  = registry_.hold();

    if (!store_.exists(type, old_name) || store_.exists(type, new_name)) {
        TraceLog(LOG_WARNING, "ASSETS: Rename %s -> %s refused: path conflict or missing source",
                 old_name.c_str(), new_name.c_str());
        throw Conflict("Rename: path conflict or missing source ('" + old_name + "' -> '" + new_name + "')");
    }

    // The open stream holds the file on some platforms; let it go first.
    // play() takes the same name lock, so the track cannot change meanwhile.
    const bool was_playing = type == AssetType::Music &&
                             playback_.state() == PlaybackController::State::Playing &&
                             playback_.track() == old_name;
    if (type == AssetType::Music && playback_.track() == old_name) {
        playback_.unload();
    }

    store_.rename(type, old_name, new_name);
    try {
        registry_.rename_references(type, old_name, new_name);
    } catch (const StorageUnavailable&) {
        TraceLog(LOG_ERROR, "ASSETS: Rename %s -> %s rolled back, mappings not writable",
                 old_name.c_str(), new_name.c_str());
        store_.rename(type, new_name, old_name);
        if (was_playing) restore_playback(old_name);
        throw;
    }

    TraceLog(LOG_INFO, "ASSETS: Renamed %s: %s -> %s", asset_type_name(type), old_name.c_str(), new_name.c_str());
    return new_name;
}

void AssetService::play(const std::string& track) {
    auto guard = locks_.acquire(AssetType::Music, track);
    playback_.play(track);
}

// Best effort: the caller is already failing with the original error.
void AssetService::restore_playback(const std::string& track) {
    try {
        playback_.play(track);
    } catch (const AssetNotFound& e) {
        TraceLog(LOG_WARNING, "ASSETS: Cannot resume %s: %s", track.c_str(), e.what());
    }
}

void AssetService::remove(AssetType type, const std::string& name) {
    auto guard = locks_.acquire(type, name);
    auto held  = registry_.hold();

    if (!store_.exists(type, name)) {
        TraceLog(LOG_WARNING, "ASSETS: Delete refused, no %s file %s", asset_type_name(type), name.c_str());
        throw NotFound("Delete: no " + std::string(asset_type_name(type)) + " file '" + name + "'");
    }

    if (type == AssetType::Music) {
        playback_.unload();
    }

    // Park the file under a name no listing picks up; it is only removed for
    // good once the references are cleared.
    const std::string parked = "." + name + ".deleting";
    store_.rename(type, name, parked);
    try {
        registry_.clear_references(type, name);
    } catch (const StorageUnavailable&) {
        TraceLog(LOG_ERROR, "ASSETS: Delete of %s rolled back, mappings not writable", name.c_str());
        store_.rename(type, parked, name);
        throw;
    }
    store_.remove(type, parked);

    TraceLog(LOG_INFO, "ASSETS: Deleted %s: %s", asset_type_name(type), name.c_str());
}

void AssetService::map(int slot_id, const SlotPatch& patch) {
    auto held = registry_.hold();

    if (patch.filename && *patch.filename && !store_.exists(AssetType::Music, **patch.filename)) {
        throw AssetNotFound("Map: no music file '" + **patch.filename + "'");
    }
    if (patch.icon && *patch.icon && !store_.exists(AssetType::Icon, **patch.icon)) {
        throw AssetNotFound("Map: no icon file '" + **patch.icon + "'");
    }

    registry_.update_slot(slot_id, patch);
    TraceLog(LOG_INFO, "ASSETS: Mapped slot %d", slot_id);
}

void AssetService::unmap(int slot_id) {
    registry_.clear_slot(slot_id);
    TraceLog(LOG_INFO, "ASSETS: Unmapped slot %d", slot_id);
}
