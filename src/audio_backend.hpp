#pragma once
#include <string>

// ---------------------------------------------------------------------------
// AudioBackend — the single music output the PlaybackController drives.
//
// The Raylib implementation streams one Music handle; tests substitute a
// recording fake so the controller's state machine runs without an audio
// device.
// ---------------------------------------------------------------------------

class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Opens a new stream for path. On failure returns false and keeps the
    // previously loaded stream (if any) untouched.
    virtual bool load(const std::string& path) = 0;

    // Starts the loaded stream from the beginning, looping.
    virtual void play() = 0;
    virtual void stop() = 0;

    // Closes the loaded stream and releases the file handle.
    virtual void unload() = 0;

    virtual void set_volume(float level) = 0;

    // Refills stream buffers; called once per frame.
    virtual void update() = 0;
};
