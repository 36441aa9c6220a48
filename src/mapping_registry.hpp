#pragma once
#include "slot.hpp"
#include <filesystem>
#include <mutex>
#include <string>

// ---------------------------------------------------------------------------
// MappingRegistry — sole owner of the persisted mapping document.
//
// Every call is a whole-document operation: load() reads the full file,
// save() rewrites it through a temporary file and a rename, and the mutating
// calls run load → modify → save under one lock. There is no partial
// persistence.
//
// hold() exposes the same (recursive) lock so a caller can pair a file
// rename or delete with the matching reference update: no other registry
// call can observe the document in between.
//
// Unknown slot ids in update_slot() / clear_slot() are silent no-ops.
// ---------------------------------------------------------------------------

class MappingRegistry {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    explicit MappingRegistry(std::filesystem::path file);

    // Creates and persists the default document when nothing is stored yet.
    // Throws StorageUnavailable on I/O or parse failure.
    MappingDocument load();

    // Throws StorageUnavailable on I/O failure; the previous file is left
    // intact in that case.
    void save(const MappingDocument& doc);

    void update_slot(int slot_id, const SlotPatch& patch);
    void clear_slot(int slot_id);

    void rename_references(AssetType type, const std::string& old_name, const std::string& new_name);
    void clear_references(AssetType type, const std::string& name);

    Lock hold();

    const std::filesystem::path& path() const { return file_; }

private:
    template<typename Fn>
    void modify(Fn&& fn) {
        Lock lock(mutex_);
        MappingDocument doc = load();
        fn(doc);
        save(doc);
    }

    std::filesystem::path file_;
    std::recursive_mutex  mutex_;
};
