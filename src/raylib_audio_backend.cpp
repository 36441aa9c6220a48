#include "raylib_audio_backend.hpp"

bool RaylibAudioBackend::load(const std::string& path) {
    Music next = LoadMusicStream(path.c_str());
    if (next.ctxData == nullptr || next.frameCount == 0) {
        return false;
    }
    unload();
    music_ = next;
    music_.looping = true;
    loaded_ = true;
    SetMusicVolume(music_, volume_);
    return true;
}

void RaylibAudioBackend::play() {
    if (loaded_) PlayMusicStream(music_);
}

void RaylibAudioBackend::stop() {
    if (loaded_) StopMusicStream(music_);
}

void RaylibAudioBackend::unload() {
    if (!loaded_) return;
    StopMusicStream(music_);
    UnloadMusicStream(music_);
    music_  = Music{};
    loaded_ = false;
}

void RaylibAudioBackend::set_volume(float level) {
    volume_ = level;
    if (loaded_) SetMusicVolume(music_, volume_);
}

void RaylibAudioBackend::update() {
    if (loaded_) UpdateMusicStream(music_);
}
