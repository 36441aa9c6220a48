#pragma once
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error kinds raised by the core. Every one is per-request except
// StorageUnavailable during startup, which main() treats as fatal.
// ---------------------------------------------------------------------------

struct BardBoxError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The mapping document could not be read, parsed or written.
struct StorageUnavailable : BardBoxError {
    using BardBoxError::BardBoxError;
};

// Playback was asked for a file that is not in the music directory.
struct AssetNotFound : BardBoxError {
    using BardBoxError::BardBoxError;
};

// Rename source missing or destination already taken.
struct Conflict : BardBoxError {
    using BardBoxError::BardBoxError;
};

// Delete target missing.
struct NotFound : BardBoxError {
    using BardBoxError::BardBoxError;
};

// Upload with an empty name or an extension the asset type does not accept.
struct InvalidRequest : BardBoxError {
    using BardBoxError::BardBoxError;
};
