#include "controller/GameController.hpp"

namespace pillpanic::controller {

GameController::GameController(core::GameEngine& engine)
    : engine_{engine}
{
}

void GameController::handleAction(InputAction action) {
    using core::Direction;
    using core::GameStatus;

    // Terminal states only leave through startGame, which the menu layer owns
    if (engine_.status() == GameStatus::GameOver
        || engine_.status() == GameStatus::LevelComplete) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        engine_.movePill(Direction::Left);
        break;
    case InputAction::MoveRight:
        engine_.movePill(Direction::Right);
        break;
    case InputAction::SoftDrop:
        engine_.movePill(Direction::Down);
        break;
    case InputAction::HardDrop:
        engine_.dropPill();
        break;
    case InputAction::Rotate:
        engine_.rotatePill();
        break;
    case InputAction::FastDropPressed:
        engine_.setFastDrop(true);
        break;
    case InputAction::FastDropReleased:
        engine_.setFastDrop(false);
        break;
    case InputAction::PauseResume:
        if (engine_.status() == GameStatus::Playing) {
            engine_.pause();
        } else if (engine_.status() == GameStatus::Paused) {
            engine_.resume();
        }
        break;
    }
}

void GameController::update(Duration elapsed) {
    engine_.update(elapsed);
}

} // namespace pillpanic::controller
