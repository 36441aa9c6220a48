#include "asset_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

AssetStore::AssetStore(fs::path music_dir, fs::path icon_dir)
    : music_dir_(std::move(music_dir)), icon_dir_(std::move(icon_dir)) {}

void AssetStore::ensure_directories() const {
    for (const auto* d : {&music_dir_, &icon_dir_}) {
        std::error_code ec;
        fs::create_directories(*d, ec);
        if (ec) {
            throw StorageUnavailable("AssetStore: cannot create '" + d->string() + "': " + ec.message());
        }
    }
}

const fs::path& AssetStore::dir(AssetType type) const {
    return type == AssetType::Music ? music_dir_ : icon_dir_;
}

fs::path AssetStore::path(AssetType type, const std::string& name) const {
    return dir(type) / name;
}

bool AssetStore::is_plain_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool AssetStore::exists(AssetType type, const std::string& name) const {
    if (!is_plain_name(name)) return false;
    std::error_code ec;
    return fs::is_regular_file(path(type, name), ec);
}

std::vector<std::string> AssetStore::list(AssetType type) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir(type), ec);
    if (ec) {
        throw StorageUnavailable("AssetStore: cannot list '" + dir(type).string() + "': " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        std::string name = it->path().filename().string();
        if (accepts_extension(type, name)) names.push_back(std::move(name));
    }
    if (ec) {
        throw StorageUnavailable("AssetStore: cannot list '" + dir(type).string() + "': " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void AssetStore::rename(AssetType type, const std::string& old_name, const std::string& new_name) const {
    if (!is_plain_name(old_name) || !is_plain_name(new_name)) {
        throw InvalidRequest("AssetStore: invalid name in rename '" + old_name + "' -> '" + new_name + "'");
    }
    std::error_code ec;
    fs::rename(path(type, old_name), path(type, new_name), ec);
    if (ec) {
        throw StorageUnavailable("AssetStore: rename '" + old_name + "' -> '" + new_name + "' failed: " + ec.message());
    }
}

void AssetStore::remove(AssetType type, const std::string& name) const {
    if (!is_plain_name(name)) {
        throw InvalidRequest("AssetStore: invalid name '" + name + "'");
    }
    std::error_code ec;
    if (!fs::remove(path(type, name), ec) || ec) {
        throw StorageUnavailable("AssetStore: cannot remove '" + name + "'" +
                                 (ec ? ": " + ec.message() : std::string()));
    }
}

void AssetStore::write(AssetType type, const std::string& name, const std::string& bytes) const {
    if (!is_plain_name(name)) {
        throw InvalidRequest("AssetStore: invalid name '" + name + "'");
    }
    const fs::path target = path(type, name);
    const fs::path tmp    = dir(type) / ("." + name + ".part");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageUnavailable("AssetStore: cannot open '" + tmp.string() + "' for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw StorageUnavailable("AssetStore: short write to '" + tmp.string() + "'");
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageUnavailable("AssetStore: cannot commit '" + target.string() + "'");
    }
}

// ---------------------------------------------------------------------------
// NameLocks
// ---------------------------------------------------------------------------

NameLocks::Guard NameLocks::acquire(AssetType type, const std::string& name) {
    return acquire_keys({std::string(asset_type_name(type)) + "/" + name});
}

NameLocks::Guard NameLocks::acquire(AssetType type, const std::string& a, const std::string& b) {
    const std::string prefix = std::string(asset_type_name(type)) + "/";
    return acquire_keys({prefix + a, prefix + b});
}

NameLocks::Guard NameLocks::acquire_keys(std::vector<std::string> keys) {
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    Guard guard;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (auto it = table_.begin(); it != table_.end();) {
            it = it->second.expired() ? table_.erase(it) : std::next(it);
        }
        for (const auto& key : keys) {
            auto m = table_[key].lock();
            if (!m) {
                m = std::make_shared<std::mutex>();
                table_[key] = m;
            }
            guard.mutexes_.push_back(std::move(m));
        }
    }
    // Lock outside the table mutex; holders of other names must stay able to
    // register while we wait.
    for (auto& m : guard.mutexes_) {
        guard.locks_.emplace_back(*m);
    }
    return guard;
}

size_t NameLocks::size() {
    std::lock_guard<std::mutex> lock(table_mutex_);
    size_t live = 0;
    for (const auto& entry : table_) {
        if (!entry.second.expired()) ++live;
    }
    return live;
}
