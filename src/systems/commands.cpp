#include "commands.hpp"
#include "../components.hpp"
#include "../errors.hpp"
#include "../events.hpp"
#include "../icon_cache.hpp"
#include "../soundboard_context.hpp"
#include <raylib.h>
#include <cstdio>
#include <memory>

using namespace ecs;

// Runs one command; a BardBoxError becomes the board's status line.
template<typename Fn>
static void run(BoardState& board, Fn&& fn) {
    try {
        fn();
    } catch (const StorageUnavailable& e) {
        TraceLog(LOG_ERROR, "BOARD: %s", e.what());
        board.report(e.what(), true);
    } catch (const BardBoxError& e) {
        TraceLog(LOG_WARNING, "BOARD: %s", e.what());
        board.report(e.what(), true);
    }
}

template<typename T, typename Fn>
static void each_event(World& world, Fn&& fn) {
    if (const auto* evts = world.try_resource<Events<T>>()) {
        for (const auto& ev : evts->read()) fn(ev);
    }
}

std::string CommandSystem::upload_file(AssetService& service, const std::string& path) {
    const std::string name = GetFileName(path.c_str());
    AssetType type;
    if (accepts_extension(AssetType::Music, name))     type = AssetType::Music;
    else if (accepts_extension(AssetType::Icon, name)) type = AssetType::Icon;
    else throw InvalidRequest("Upload: '" + name + "' is neither music nor an icon");

    int size = 0;
    unsigned char* data = LoadFileData(path.c_str(), &size);
    if (!data) {
        throw InvalidRequest("Upload: cannot read '" + path + "'");
    }
    std::string bytes(reinterpret_cast<const char*>(data), static_cast<size_t>(size));
    UnloadFileData(data);

    return service.upload(type, name, bytes);
}

void CommandSystem::Update(World& world, float /*dt*/) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<SoundboardContext>>();
    auto* board_ptr = world.try_resource<BoardState>();
    if (!ctx_ptr || !*ctx_ptr || !board_ptr) return;
    auto& ctx   = **ctx_ptr;
    auto& board = *board_ptr;
    bool assets_changed = false;

    each_event<PlaySlotEvent>(world, [&](const PlaySlotEvent& ev) {
        run(board, [&]() {
            const MappingDocument doc = ctx.registry.load();
            const Slot* slot = doc.find(ev.slot_id);
            if (!slot || !slot->filename) {
                board.report(default_label(ev.slot_id) + " has no track");
                return;
            }
            ctx.service.play(*slot->filename);
            board.report("Playing " + *slot->filename);
        });
    });

    each_event<StopEvent>(world, [&](const StopEvent&) {
        ctx.playback.stop();
        board.report("Stopped");
    });

    each_event<VolumeStepEvent>(world, [&](const VolumeStepEvent& ev) {
        const float applied = ctx.playback.set_volume(ctx.playback.volume() + ev.delta);
        char b[32];
        std::snprintf(b, sizeof(b), "Volume %d%%", static_cast<int>(applied * 100.0f + 0.5f));
        board.report(b);
    });

    each_event<MapAssetEvent>(world, [&](const MapAssetEvent& ev) {
        run(board, [&]() {
            SlotPatch patch;
            if (ev.asset.type == AssetType::Music) patch.filename = ev.asset.name;
            else                                   patch.icon     = ev.asset.name;
            ctx.service.map(ev.slot_id, patch);
            board.report(ev.asset.name + " -> " + default_label(ev.slot_id));
            board.catalog_dirty = true;
        });
    });

    each_event<UnmapSlotEvent>(world, [&](const UnmapSlotEvent& ev) {
        run(board, [&]() {
            ctx.service.unmap(ev.slot_id);
            board.report(default_label(ev.slot_id) + " cleared");
            board.catalog_dirty = true;
        });
    });

    each_event<RelabelSlotEvent>(world, [&](const RelabelSlotEvent& ev) {
        run(board, [&]() {
            SlotPatch patch;
            patch.label = ev.label.empty() ? default_label(ev.slot_id) : ev.label;
            ctx.service.map(ev.slot_id, patch);
            board.catalog_dirty = true;
        });
    });

    each_event<RenameAssetEvent>(world, [&](const RenameAssetEvent& ev) {
        run(board, [&]() {
            const std::string renamed = ctx.service.rename(ev.asset.type, ev.asset.name, ev.new_base);
            if (board.selection == ev.asset) board.selection = AssetRef{ev.asset.type, renamed};
            board.report("Renamed " + ev.asset.name + " -> " + renamed);
            assets_changed = true;
        });
    });

    each_event<DeleteAssetEvent>(world, [&](const DeleteAssetEvent& ev) {
        run(board, [&]() {
            ctx.service.remove(ev.asset.type, ev.asset.name);
            if (board.selection == ev.asset) board.selection.reset();
            board.report("Deleted " + ev.asset.name);
            assets_changed = true;
        });
    });

    each_event<UploadFileEvent>(world, [&](const UploadFileEvent& ev) {
        run(board, [&]() {
            const std::string stored = upload_file(ctx.service, ev.path);
            board.report("Uploaded " + stored);
            assets_changed = true;
        });
    });

    if (assets_changed) {
        board.catalog_dirty = true;
        if (auto* icons = world.try_resource<IconCache>()) icons->clear();
    }

    // Cleared up front: a failing reload is reported once, not every frame.
    if (board.catalog_dirty) {
        board.catalog_dirty = false;
        run(board, [&]() { board.catalog = ctx.service.catalog(); });
    }
}
