#pragma once

#include <raylib.h>

#include <cstdint>

namespace nodeflow {

// ============================================================================
// Core Types
// ============================================================================

using Tick = std::uint64_t;

inline constexpr Vector2 kVectorZero{0.0f, 0.0f};
inline constexpr Vector2 kVectorOne{1.0f, 1.0f};
inline constexpr Vector2 kAnchorCenter{0.5f, 0.5f};

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

} // namespace nodeflow
