#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/GameEngine.hpp"
#include "core/Grid.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"

using namespace pillpanic::core;

namespace {

char colorLetter(Color c) {
    switch (c) {
    case Color::Red:    return 'r';
    case Color::Blue:   return 'b';
    case Color::Yellow: return 'y';
    }
    return '?';
}

// Helper: render the board + falling entities as ASCII.
// Infections are lowercase, placed capsule cells uppercase, falling cells '*'.
void printGame(const GameEngine& game) {
    const Grid& board = game.board();

    std::vector<std::string> lines(BoardHeight, std::string(BoardWidth, '.'));

    for (int y = 0; y < BoardHeight; ++y) {
        for (int x = 0; x < BoardWidth; ++x) {
            const Cell cell = *board.get(x, y);
            if (cell.kind == CellKind::Infection) {
                lines[y][x] = colorLetter(cell.color);
            } else if (cell.kind == CellKind::Piece) {
                lines[y][x] = static_cast<char>(colorLetter(cell.color) - 'a' + 'A');
            }
        }
    }

    for (const auto& entity : game.fallingEntities()) {
        for (const auto& p : entityPositions(entity)) {
            if (Grid::isInBounds(p)) {
                lines[p.y][p.x] = '*';
            }
        }
    }

    const Stats stats = game.stats();
    std::cout << "\n==== PILL PANIC CONSOLE VIEW ====\n";
    std::cout << "Score: " << stats.score
              << " | Level: " << stats.level
              << " | Infections: " << stats.infectionCount
              << " | Speed: " << stats.speedLevel
              << " | Status: " << toString(game.status()) << '\n';

    if (const FallingEntity* controlled = game.controlledEntity()) {
        if (const auto* capsule = std::get_if<Capsule>(controlled)) {
            std::cout << "Controlling capsule "
                      << colorLetter(capsule->colors()[0])
                      << colorLetter(capsule->colors()[1]) << '\n';
        } else {
            std::cout << "Controlling fragment(s)\n";
        }
    }

    std::cout << '+' << std::string(BoardWidth, '-') << "+\n";
    for (const auto& line : lines) {
        std::cout << '|' << line << "|\n";
    }
    std::cout << '+' << std::string(BoardWidth, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, s = soft drop, w = rotate\n"
              << "  h = hard drop, g = gravity tick, f = run one second\n"
              << "  p = pause/resume, n = next/restart level, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    int level = 1;
    if (argc > 1) {
        try {
            level = std::stoi(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [level]\n";
            return 1;
        }
    }

    spdlog::set_level(spdlog::level::warn);

    GameEngine game{};
    pillpanic::controller::GameController controller{game};

    try {
        game.startGame(level);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    std::string cmd;
    printGame(game);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        using pillpanic::controller::InputAction;
        using Duration = pillpanic::controller::GameController::Duration;

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 's': case 'S':
            controller.handleAction(InputAction::SoftDrop);
            break;
        case 'w': case 'W':
            controller.handleAction(InputAction::Rotate);
            break;
        case 'h': case 'H':
            controller.handleAction(InputAction::HardDrop);
            break;
        case 'g': case 'G':
            game.tick();
            break;
        case 'f': case 'F':
            // 60 frames of wall-clock time
            for (int i = 0; i < 60; ++i) {
                controller.update(Duration{1000.0 / 60.0});
            }
            break;
        case 'p': case 'P':
            controller.handleAction(InputAction::PauseResume);
            break;
        case 'n': case 'N':
            if (game.status() == GameStatus::LevelComplete) {
                // carry the score into the next level
                ++level;
                game.startGame(level, game.stats().speedSetting, game.stats().score);
            } else {
                game.startGame(level);
            }
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printGame(game);

        if (game.status() == GameStatus::GameOver) {
            std::cout << "GAME OVER. Press 'n' to restart or 'q' to quit.\n";
        } else if (game.status() == GameStatus::LevelComplete) {
            std::cout << "LEVEL COMPLETE. Press 'n' for the next level or 'q' to quit.\n";
        }
    }

    return 0;
}
