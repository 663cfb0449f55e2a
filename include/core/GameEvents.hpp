#pragma once

#include "Types.hpp"
#include <cstdint>
#include <functional>

namespace pillpanic::core {

enum class GameStatus {
    Menu,
    Playing,
    Paused,
    GameOver,
    LevelComplete
};

inline const char* toString(GameStatus status) noexcept {
    switch (status) {
    case GameStatus::Menu:          return "Menu";
    case GameStatus::Playing:       return "Playing";
    case GameStatus::Paused:        return "Paused";
    case GameStatus::GameOver:      return "GameOver";
    case GameStatus::LevelComplete: return "LevelComplete";
    }
    return "Unknown";
}

// Immutable snapshot handed to collaborators
struct Stats {
    std::uint64_t score{0};
    int level{1};
    int infectionCount{0};
    int linesCleared{0};
    int piecesPlaced{0};
    int speedLevel{0};
    SpeedSetting speedSetting{SpeedSetting::Medium};
};

enum class SoundEvent {
    Move,
    Rotate,
    Drop,
    Match,
    LevelComplete,
    GameOver
};

using SoundCallback = std::function<void(SoundEvent)>;

// Push notifications, all optional and synchronous
struct EngineCallbacks {
    std::function<void(GameStatus)> onStateChange;
    std::function<void(const Stats&)> onStatsChange;
    std::function<void()> onBoardChange;
};

} // namespace pillpanic::core
