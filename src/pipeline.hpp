#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(func); }
    void add_logic(SystemFunc func) { logic_.push_back(func); }
    void add_audio(SystemFunc func) { audio_.push_back(func); }
    void add_render(SystemFunc func) { render_.push_back(func); }

    /**
     * @brief Input, then commands; structural changes are flushed last.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Board commands (registry, assets, playback)
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes before rendering
        world.deferred().flush(world);
    }

    /**
     * @brief Feeds the music stream. Runs every frame, even while a prompt
     * is open, or the track stalls once its buffers drain.
     */
    void pump_audio(World& world, float dt) {
        for (auto& sys : audio_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> audio_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
