#pragma once

#include "nodeflow/core/config.hpp"

#include <cstdarg>
#include <map>
#include <string>
#include <string_view>

namespace nodeflow::core {

/// Subsystem tag a message starts with: "physics" for "[physics] ...". Empty without one.
std::string_view subsystem_tag(std::string_view text);

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (levels, stderr sink, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool has_file_sink() const { return file_ != nullptr; }

    /// Whether a message at `level` passes the threshold of its subsystem.
    bool accepts(int level, std::string_view text) const;

private:
    Logger() = default;

    void* file_{nullptr};
    bool callback_installed_{false};

    int level_{0};
    std::map<std::string, int, std::less<>> subsystem_levels_{};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace nodeflow::core
