#pragma once
#include "audio_backend.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class AssetStore;

// ---------------------------------------------------------------------------
// PlaybackController — exclusive owner of the audio output.
//
// Two states: Stopped and Playing(track). All transitions, the volume and
// the per-frame stream pump are serialized by one mutex; when calls race the
// last one to finish decides the final state.
// ---------------------------------------------------------------------------

class PlaybackController {
public:
    enum class State { Stopped, Playing };

    PlaybackController(std::unique_ptr<AudioBackend> backend,
                       const AssetStore& store,
                       float initial_volume = 1.0f);

    // Loads the named music asset and plays it, looping, replacing whatever
    // was playing. Throws AssetNotFound (state unchanged) if the file is not
    // in the music directory or cannot be opened as audio.
    void play(const std::string& track);

    // Idempotent.
    void stop();

    // Clamps to [0, 1] (NaN counts as 0) and returns the applied level.
    float set_volume(float level);

    // Releases the current track's file handle; leaves the controller Stopped.
    void unload();

    void update();

    State                      state() const;
    std::optional<std::string> track() const;
    float                      volume() const;

private:
    std::unique_ptr<AudioBackend> backend_;
    const AssetStore&             store_;

    mutable std::mutex         mutex_;
    State                      state_  = State::Stopped;
    std::optional<std::string> track_;  // name of the loaded stream, if any
    float                      volume_ = 1.0f;
};
