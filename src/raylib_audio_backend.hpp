#pragma once
#include "audio_backend.hpp"
#include <raylib.h>

// ---------------------------------------------------------------------------
// RaylibAudioBackend — one looping Music stream.
//
// Requires InitAudioDevice() before the first load() and must be destroyed
// (or unload()ed) before CloseAudioDevice(). LoadMusicStream() returns a
// zeroed Music on a missing or undecodable file; load() treats that as
// failure and keeps the stream it already had.
// ---------------------------------------------------------------------------

class RaylibAudioBackend final : public AudioBackend {
public:
    RaylibAudioBackend() = default;
    ~RaylibAudioBackend() override { unload(); }

    RaylibAudioBackend(const RaylibAudioBackend&) = delete;
    RaylibAudioBackend& operator=(const RaylibAudioBackend&) = delete;

    bool load(const std::string& path) override;
    void play() override;
    void stop() override;
    void unload() override;
    void set_volume(float level) override;
    void update() override;

private:
    Music music_{};
    bool  loaded_ = false;
    float volume_ = 1.0f;
};
