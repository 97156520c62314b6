#pragma once

#include <map>
#include <string>

namespace nodeflow::core {

struct WindowConfig {
    int width{800};
    int height{450};
    std::string title{"nodeflow"};
    int target_fps{60};
    bool vsync{false};
};

struct EngineConfig {
    int fixed_fps{60};
};

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};

    // Per-subsystem thresholds keyed by message tag ("scene", "physics", ...).
    // Set with `level.<tag> = <level>` under [logging].
    std::map<std::string, int, std::less<>> subsystem_levels{};

    bool collision_debug{false};
};

struct DebugConfig {
    bool draw_shapes{false};
};

struct PhysicsConfig {
    bool warn_missing_shape{true};
};

struct EngineSettings {
    WindowConfig window{};
    EngineConfig engine{};
    LoggingConfig logging{};
    DebugConfig debug{};
    PhysicsConfig physics{};
};

class Config {
public:
    Config();

    static Config& instance();

    bool load_from_file(const std::string& path);

    /// Same INI format as load_from_file, from memory.
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const EngineSettings& get() const { return config_; }

    const WindowConfig& window() const { return config_.window; }
    const EngineConfig& engine() const { return config_.engine; }
    const LoggingConfig& logging() const { return config_.logging; }
    const DebugConfig& debug() const { return config_.debug; }
    const PhysicsConfig& physics() const { return config_.physics; }

private:
    EngineSettings config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    static int log_level_from_string(const std::string& v, int default_value);

    void parse_line(std::string line, std::string& section);
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace nodeflow::core
