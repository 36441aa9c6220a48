#include "audio.hpp"
#include "../soundboard_context.hpp"
#include <memory>

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* ctx = world.try_resource<std::shared_ptr<SoundboardContext>>();
    if (!ctx || !*ctx) return;
    (*ctx)->playback.update();
}
