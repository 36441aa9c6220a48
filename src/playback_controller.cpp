#include "playback_controller.hpp"
#include "asset_store.hpp"
#include "errors.hpp"
#include <raylib.h>
#include <algorithm>
#include <cmath>

static float clamp_volume(float level) {
    if (std::isnan(level)) return 0.0f;
    return std::clamp(level, 0.0f, 1.0f);
}

PlaybackController::PlaybackController(std::unique_ptr<AudioBackend> backend,
                                       const AssetStore& store,
                                       float initial_volume)
    : backend_(std::move(backend)), store_(store), volume_(clamp_volume(initial_volume)) {
    backend_->set_volume(volume_);
}

void PlaybackController::play(const std::string& track) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!store_.exists(AssetType::Music, track)) {
        TraceLog(LOG_WARNING, "PLAYBACK: File not found: %s", track.c_str());
        throw AssetNotFound("Playback: no music file '" + track + "'");
    }
    if (!backend_->load(store_.path(AssetType::Music, track).string())) {
        TraceLog(LOG_WARNING, "PLAYBACK: Cannot open %s as audio", track.c_str());
        throw AssetNotFound("Playback: cannot open '" + track + "' as audio");
    }

    backend_->set_volume(volume_);
    backend_->play();
    state_ = State::Playing;
    track_ = track;
    TraceLog(LOG_INFO, "PLAYBACK: Playback started: %s", track.c_str());
}

void PlaybackController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Stopped) return;
    backend_->stop();
    state_ = State::Stopped;
}

float PlaybackController::set_volume(float level) {
    std::lock_guard<std::mutex> lock(mutex_);
    volume_ = clamp_volume(level);
    backend_->set_volume(volume_);
    return volume_;
}

void PlaybackController::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_->unload();
    state_ = State::Stopped;
    track_.reset();
}

void PlaybackController::update() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Playing) backend_->update();
}

PlaybackController::State PlaybackController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> PlaybackController::track() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return track_;
}

float PlaybackController::volume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volume_;
}
