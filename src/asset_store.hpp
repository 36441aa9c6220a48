#pragma once
#include "slot.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AssetStore — the music and icon directories.
//
// Pure storage: existence, listing, rename, remove, write. Names are plain
// file names (no separators, not "." or ".."); exists() answers false for
// anything else and the mutating calls throw InvalidRequest. I/O failures
// surface as StorageUnavailable.
// ---------------------------------------------------------------------------

class AssetStore {
public:
    AssetStore(std::filesystem::path music_dir, std::filesystem::path icon_dir);

    // Creates both directories if they do not exist yet.
    void ensure_directories() const;

    const std::filesystem::path& dir(AssetType type) const;
    std::filesystem::path path(AssetType type, const std::string& name) const;

    bool exists(AssetType type, const std::string& name) const;

    // Regular files whose extension the type accepts, sorted by name.
    std::vector<std::string> list(AssetType type) const;

    void rename(AssetType type, const std::string& old_name, const std::string& new_name) const;
    void remove(AssetType type, const std::string& name) const;

    // Writes through a sibling temporary file so a reader never sees a
    // truncated asset. Overwrites an existing file of the same name.
    void write(AssetType type, const std::string& name, const std::string& bytes) const;

    static bool is_plain_name(const std::string& name);

private:
    std::filesystem::path music_dir_;
    std::filesystem::path icon_dir_;
};

// ---------------------------------------------------------------------------
// NameLocks — one mutex per (type, file name), created on demand.
//
// acquire() locks every requested key in sorted order, so two operations
// touching overlapping names (a rename and a delete of the same file) cannot
// deadlock and cannot interleave. Unrelated names never contend.
// ---------------------------------------------------------------------------

class NameLocks {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;

    private:
        friend class NameLocks;
        // Mutexes must outlive the locks that refer to them; members are
        // destroyed in reverse order.
        std::vector<std::shared_ptr<std::mutex>>  mutexes_;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    Guard acquire(AssetType type, const std::string& name);
    Guard acquire(AssetType type, const std::string& a, const std::string& b);

    // Number of live entries; exposed for tests.
    size_t size();

private:
    Guard acquire_keys(std::vector<std::string> keys);

    std::mutex table_mutex_;
    std::map<std::string, std::weak_ptr<std::mutex>> table_;
};
