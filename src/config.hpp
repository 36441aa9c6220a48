#pragma once
#include <filesystem>
#include <string>

// ---------------------------------------------------------------------------
// AppConfig — startup settings, read from a JSON file.
//
// Every key is optional. Relative directories resolve against the working
// directory; mapping_file resolves against data_dir.
// ---------------------------------------------------------------------------

struct AppConfig {
    std::string data_dir     = "data";
    std::string music_dir    = "static/music";
    std::string icon_dir     = "static/icons";
    std::string mapping_file = "mappings.json";

    int         window_width  = 1280;
    int         window_height = 720;
    std::string title         = "BardBox";

    float       initial_volume = 1.0f;
    std::string log_level      = "info";

    std::filesystem::path mapping_path() const;

    // Raylib TraceLogLevel for log_level; unknown names map to LOG_INFO.
    int trace_log_level() const;
};

class ConfigLoader {
public:
    // Returns false if the file cannot be opened or does not hold a valid
    // config; out is left untouched then.
    static bool load(AppConfig& out, const std::string& path);

    // Same as load() without the file I/O.
    static bool load_from_string(AppConfig& out, const std::string& json);
};
