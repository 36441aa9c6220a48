#pragma once
#include <raylib.h>
#include <map>
#include <string>

class AssetStore;

// ---------------------------------------------------------------------------
// IconCache — Texture2D per icon name, loaded on first use.
//
// Stored as a World resource. A failed load is cached too (texture id 0) so a
// broken file is not retried every frame; clear() drops everything, and is
// called whenever the asset listing changes. unload() must run before
// CloseWindow().
// ---------------------------------------------------------------------------

struct IconCache {
    // nullptr if the icon could not be loaded.
    const Texture2D* get(const AssetStore& store, const std::string& name);

    void clear();
    void unload() { clear(); }

    size_t size() const { return textures_.size(); }

private:
    std::map<std::string, Texture2D> textures_;
};
