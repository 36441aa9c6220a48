#pragma once
#include "slot.hpp"
#include <ecs/ecs.hpp>
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// Sends into the World's Events<T> queue; dropped if the queue was never
// registered.
template<typename T>
void emit(ecs::World& world, T event) {
    if (auto* q = world.try_resource<Events<T>>()) q->send(std::move(event));
}

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Board events — emitted by BoardInputSystem, consumed by CommandSystem
// ---------------------------------------------------------------------------

struct PlaySlotEvent {
    int slot_id;
};

struct StopEvent {};

// Relative change; the controller clamps the result.
struct VolumeStepEvent {
    float delta;
};

// Music goes to the slot's filename, an icon to its icon.
struct MapAssetEvent {
    int      slot_id;
    AssetRef asset;
};

struct UnmapSlotEvent {
    int slot_id;
};

struct RelabelSlotEvent {
    int         slot_id;
    std::string label;
};

// new_base may omit the extension; the service appends the original one.
struct RenameAssetEvent {
    AssetRef    asset;
    std::string new_base;
};

struct DeleteAssetEvent {
    AssetRef asset;
};

// A file dropped on the window; path is on the local filesystem.
struct UploadFileEvent {
    std::string path;
};
