#include "config.hpp"
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

std::filesystem::path AppConfig::mapping_path() const {
    return std::filesystem::path(data_dir) / mapping_file;
}

int AppConfig::trace_log_level() const {
    if (log_level == "trace")   return LOG_TRACE;
    if (log_level == "debug")   return LOG_DEBUG;
    if (log_level == "info")    return LOG_INFO;
    if (log_level == "warning") return LOG_WARNING;
    if (log_level == "error")   return LOG_ERROR;
    if (log_level == "none")    return LOG_NONE;
    return LOG_INFO;
}

bool ConfigLoader::load_from_string(AppConfig& out, const std::string& json_str) {
    try {
        const json j = json::parse(json_str);
        if (!j.is_object()) return false;

        AppConfig cfg;
        cfg.data_dir       = j.value("data_dir",       cfg.data_dir);
        cfg.music_dir      = j.value("music_dir",      cfg.music_dir);
        cfg.icon_dir       = j.value("icon_dir",       cfg.icon_dir);
        cfg.mapping_file   = j.value("mapping_file",   cfg.mapping_file);
        cfg.window_width   = j.value("window_width",   cfg.window_width);
        cfg.window_height  = j.value("window_height",  cfg.window_height);
        cfg.title          = j.value("title",          cfg.title);
        cfg.initial_volume = std::clamp(j.value("initial_volume", cfg.initial_volume), 0.0f, 1.0f);
        cfg.log_level      = j.value("log_level",      cfg.log_level);

        if (cfg.window_width <= 0 || cfg.window_height <= 0) return false;
        out = std::move(cfg);
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

bool ConfigLoader::load(AppConfig& out, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(out, content);
}
