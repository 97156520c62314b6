#pragma once

#include "nodeflow/scene/types.hpp"

#include <cstdint>
#include <string>

namespace nodeflow::scene {

enum class InputType : std::uint8_t {
    KeyPressed,
    KeyReleased,
    MouseButtonPressed,
    MouseButtonReleased,
};

/// A registered interest in (type, key), delivered to `target` when it fires.
struct InputEvent {
    InputType type{InputType::KeyPressed};
    int key{0};
    std::string tag{};
    NodeId target{kNullNode};
};

} // namespace nodeflow::scene
