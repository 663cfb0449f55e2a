#pragma once

namespace pillpanic::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, touch, gamepad, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDrop,
    HardDrop,
    Rotate,
    FastDropPressed,
    FastDropReleased,
    PauseResume
};

} // namespace pillpanic::controller
