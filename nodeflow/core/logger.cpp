#include "nodeflow/core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

#include <raylib.h>

namespace nodeflow::core {

static Logger* g_logger = nullptr;

// Seconds since the logger was first used; the window clock may not exist yet.
static double elapsed_seconds() {
    using clock = std::chrono::steady_clock;
    static const clock::time_point start = clock::now();
    return std::chrono::duration<double>(clock::now() - start).count();
}

std::string_view subsystem_tag(std::string_view text) {
    if (text.empty() || text.front() != '[') return {};
    const auto close = text.find(']');
    if (close == std::string_view::npos || close == 1) return {};
    return text.substr(1, close - 1);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    level_ = cfg.level;
    subsystem_levels_ = cfg.subsystem_levels;

    if (!cfg.enabled) {
        level_ = LOG_NONE;
        subsystem_levels_.clear();
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    // raylib drops messages below its own level before the callback sees them.
    int lowest = level_;
    for (const auto& [tag, level] : subsystem_levels_) {
        lowest = std::min(lowest, level);
    }
    SetTraceLogLevel(lowest);

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
    }

    elapsed_seconds();
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;

    if (!cfg.file.empty() && !file_) {
        TraceLog(LOG_WARNING, "[engine] Could not open log file '%s'", cfg.file.c_str());
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

bool Logger::accepts(int level, std::string_view text) const {
    int threshold = level_;
    const std::string_view tag = subsystem_tag(text);
    if (!tag.empty()) {
        const auto it = subsystem_levels_.find(tag);
        if (it != subsystem_levels_.end()) threshold = it->second;
    }
    return threshold != LOG_NONE && level >= threshold;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    if (g_logger && !g_logger->accepts(logLevel, text)) {
        return;
    }

    const char* level_str = "INFO";
    switch (logLevel) {
        case LOG_ALL: level_str = "ALL"; break;
        case LOG_TRACE: level_str = "TRACE"; break;
        case LOG_DEBUG: level_str = "DEBUG"; break;
        case LOG_INFO: level_str = "INFO"; break;
        case LOG_WARNING: level_str = "WARN"; break;
        case LOG_ERROR: level_str = "ERROR"; break;
        case LOG_FATAL: level_str = "FATAL"; break;
        case LOG_NONE: level_str = "NONE"; break;
        default: level_str = "INFO"; break;
    }

    const double t = elapsed_seconds();

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(sink, "[%.3f][%s] ", t, level_str);
        std::vfprintf(sink, text, args);
        std::fputc('\n', sink);
        std::fflush(sink);

        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args_copy);
        std::fputc('\n', stderr);

        va_end(args_copy);
    } else {
        std::fprintf(stderr, "[%.3f][%s] ", t, level_str);
        std::vfprintf(stderr, text, args);
        std::fputc('\n', stderr);
    }
}

} // namespace nodeflow::core
