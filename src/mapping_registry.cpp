#include "mapping_registry.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

// The reference field a scan looks at for a given asset type.
static std::optional<std::string>& reference_of(Slot& slot, AssetType type) {
    return type == AssetType::Music ? slot.filename : slot.icon;
}

MappingRegistry::MappingRegistry(fs::path file) : file_(std::move(file)) {}

MappingRegistry::Lock MappingRegistry::hold() {
    return Lock(mutex_);
}

MappingDocument MappingRegistry::load() {
    Lock lock(mutex_);

    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        if (ec) {
            throw StorageUnavailable("MappingRegistry: cannot stat '" + file_.string() + "': " + ec.message());
        }
        MappingDocument doc = MappingDocument::make_default();
        save(doc);
        TraceLog(LOG_INFO, "REGISTRY: Created default mappings at %s", file_.string().c_str());
        return doc;
    }

    std::ifstream in(file_);
    if (!in.is_open()) {
        throw StorageUnavailable("MappingRegistry: cannot open '" + file_.string() + "'");
    }
    const std::string content(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>{});
    try {
        return json::parse(content).get<MappingDocument>();
    } catch (const json::exception& e) {
        TraceLog(LOG_ERROR, "REGISTRY: Cannot parse %s", file_.string().c_str());
        throw StorageUnavailable("MappingRegistry: malformed '" + file_.string() + "': " + e.what());
    }
}

void MappingRegistry::save(const MappingDocument& doc) {
    Lock lock(mutex_);

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            throw StorageUnavailable("MappingRegistry: cannot create '" +
                                     file_.parent_path().string() + "': " + ec.message());
        }
    }

    const fs::path tmp = fs::path(file_.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw StorageUnavailable("MappingRegistry: cannot write '" + tmp.string() + "'");
        }
        out << json(doc).dump(4);
        if (!out) {
            throw StorageUnavailable("MappingRegistry: short write to '" + tmp.string() + "'");
        }
    }

    fs::rename(tmp, file_, ec);
    if (ec) {
        TraceLog(LOG_ERROR, "REGISTRY: Failed to replace %s: %s", file_.string().c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        throw StorageUnavailable("MappingRegistry: cannot replace '" + file_.string() + "'");
    }
}

void MappingRegistry::update_slot(int slot_id, const SlotPatch& patch) {
    modify([&](MappingDocument& doc) {
        if (Slot* s = doc.find(slot_id)) patch.apply(*s);
    });
}

void MappingRegistry::clear_slot(int slot_id) {
    modify([&](MappingDocument& doc) {
        if (Slot* s = doc.find(slot_id)) {
            s->filename.reset();
            s->icon.reset();
            s->label = default_label(slot_id);
        }
    });
}

void MappingRegistry::rename_references(AssetType type, const std::string& old_name, const std::string& new_name) {
    modify([&](MappingDocument& doc) {
        for (auto& s : doc.slots) {
            auto& ref = reference_of(s, type);
            if (ref && *ref == old_name) ref = new_name;
        }
    });
}

void MappingRegistry::clear_references(AssetType type, const std::string& name) {
    modify([&](MappingDocument& doc) {
        for (auto& s : doc.slots) {
            auto& ref = reference_of(s, type);
            if (ref && *ref == name) ref.reset();
        }
    });
}
