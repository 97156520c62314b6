#include "nodeflow/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <raylib.h>

namespace nodeflow::core {

static constexpr std::string_view kSubsystemLevelPrefix = "level.";

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
    config_.logging.collision_debug = false;
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    try {
        size_t idx = 0;
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) {
            return default_value;
        }
        return out;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "window") {
        if (k == "width") config_.window.width = parse_int(v, config_.window.width);
        else if (k == "height") config_.window.height = parse_int(v, config_.window.height);
        else if (k == "title") config_.window.title = v;
        else if (k == "target_fps") config_.window.target_fps = parse_int(v, config_.window.target_fps);
        else if (k == "vsync") config_.window.vsync = parse_bool(v, config_.window.vsync);
        return;
    }

    if (sec == "engine") {
        if (k == "fixed_fps") config_.engine.fixed_fps = parse_int(v, config_.engine.fixed_fps);
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        else if (k == "collision_debug") config_.logging.collision_debug = parse_bool(v, config_.logging.collision_debug);
        else if (k.rfind(kSubsystemLevelPrefix, 0) == 0 && k.size() > kSubsystemLevelPrefix.size()) {
            const std::string tag = k.substr(kSubsystemLevelPrefix.size());
            const auto it = config_.logging.subsystem_levels.find(tag);
            const int fallback = it != config_.logging.subsystem_levels.end() ? it->second : -1;
            const int level = log_level_from_string(v, fallback);
            if (level >= 0) config_.logging.subsystem_levels[tag] = level;
        }
        return;
    }

    if (sec == "debug") {
        if (k == "draw_shapes") config_.debug.draw_shapes = parse_bool(v, config_.debug.draw_shapes);
        else if (k == "collision") config_.logging.collision_debug = parse_bool(v, config_.logging.collision_debug);
        return;
    }

    if (sec == "physics") {
        if (k == "warn_missing_shape") config_.physics.warn_missing_shape = parse_bool(v, config_.physics.warn_missing_shape);
        return;
    }
}

void Config::parse_line(std::string line, std::string& section) {
    // Strip comments (# or ;) - cut at the first occurrence.
    auto hash = line.find('#');
    auto semi = line.find(';');
    size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) return;

    apply_kv(section, key, value);
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }

    loaded_from_path_ = path;
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }
}

} // namespace nodeflow::core
