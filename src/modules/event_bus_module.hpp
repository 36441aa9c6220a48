#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource, registers every board event
// queue and installs the per-frame flush as the first Pre-Update step.
// Install it first: BoardInputSystem and CommandSystem expect the queues to
// exist, and the flush must run before anything emits.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});

        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<PlaySlotEvent>(world);
        reg.register_queue<StopEvent>(world);
        reg.register_queue<VolumeStepEvent>(world);
        reg.register_queue<MapAssetEvent>(world);
        reg.register_queue<UnmapSlotEvent>(world);
        reg.register_queue<RelabelSlotEvent>(world);
        reg.register_queue<RenameAssetEvent>(world);
        reg.register_queue<DeleteAssetEvent>(world);
        reg.register_queue<UploadFileEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
