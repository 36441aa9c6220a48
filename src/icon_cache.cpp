#include "icon_cache.hpp"
#include "asset_store.hpp"

const Texture2D* IconCache::get(const AssetStore& store, const std::string& name) {
    auto it = textures_.find(name);
    if (it == textures_.end()) {
        Texture2D tex{};
        if (store.exists(AssetType::Icon, name)) {
            tex = LoadTexture(store.path(AssetType::Icon, name).string().c_str());
            if (tex.id != 0) SetTextureFilter(tex, TEXTURE_FILTER_BILINEAR);
        }
        it = textures_.emplace(name, tex).first;
    }
    return it->second.id != 0 ? &it->second : nullptr;
}

void IconCache::clear() {
    for (auto& entry : textures_) {
        if (entry.second.id != 0) UnloadTexture(entry.second);
    }
    textures_.clear();
}
