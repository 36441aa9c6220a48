#pragma once
#include "asset_store.hpp"
#include "mapping_registry.hpp"
#include "playback_controller.hpp"
#include "slot.hpp"
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AssetService — asset lifecycle as seen by the front end.
//
// Pairs every physical file operation with the registry update it implies:
//   rename: resolve name → check → move file → rename references
//   remove: check → unload playback (music) → delete file → clear references
// Both run under the per-name locks and the registry lock, so no reader sees
// a slot pointing at a file that has just moved or vanished. A failure part
// way through rolls the file back; persisted state is unchanged on error.
// ---------------------------------------------------------------------------

struct Catalog {
    MappingDocument          mappings;
    std::vector<std::string> music;
    std::vector<std::string> icons;
};

class AssetService {
public:
    AssetService(AssetStore& store, MappingRegistry& registry, PlaybackController& playback);

    Catalog catalog();

    // Stores bytes under the final path component of name. New assets start
    // unmapped. Throws InvalidRequest for an empty name or an extension the
    // type does not accept.
    std::string upload(AssetType type, const std::string& name, const std::string& bytes);

    // Appends the source extension to new_base when missing and returns the
    // resolved name. Throws InvalidRequest for an empty or hidden name, and
    // Conflict if the source is missing or the destination is taken; nothing
    // moves in either case. A track that was playing keeps playing if the
    // mappings cannot be written.
    std::string rename(AssetType type, const std::string& old_name, const std::string& new_base);

    // Starts a music track under its name lock, so it cannot interleave with a
    // rename or delete of the same file. Throws AssetNotFound.
    void play(const std::string& track);

    // Throws NotFound if the file does not exist.
    void remove(AssetType type, const std::string& name);

    // Applies a patch to one slot. References set by the patch must name
    // existing assets (AssetNotFound otherwise). Unknown ids are a no-op.
    void map(int slot_id, const SlotPatch& patch);

    void unmap(int slot_id);

    // "kick" + ".wav" → "kick.wav"; "kick.WAV" stays as is.
    static std::string resolve_rename(const std::string& old_name, const std::string& new_base);

private:
    void restore_playback(const std::string& track);

    AssetStore&         store_;
    MappingRegistry&    registry_;
    PlaybackController& playback_;
    NameLocks           locks_;
};
