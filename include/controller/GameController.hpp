#pragma once

#include "core/GameEngine.hpp"
#include "controller/InputAction.hpp"

namespace pillpanic::controller {

class GameController {
public:
    using Duration = core::GameEngine::Duration;

    /// Controller does not own the GameEngine; caller keeps it alive.
    explicit GameController(core::GameEngine& engine);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called once per frame with the time since the previous frame.
    // Fixed-step timing lives in the engine; this only forwards.
    void update(Duration elapsed);

private:
    core::GameEngine& engine_;
};

} // namespace pillpanic::controller
