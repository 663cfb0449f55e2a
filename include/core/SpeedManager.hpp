#pragma once

#include "Types.hpp"

namespace pillpanic::core {

// Fall interval bookkeeping: base interval from the speed setting, a speed-up
// every PiecesPerSpeedUp placements, and the fast-drop override.
class SpeedManager {
public:
    static constexpr int PiecesPerSpeedUp   = 10;
    static constexpr int MaxSpeedUps        = 20;
    static constexpr double SpeedUpFactor   = 0.9;
    static constexpr int MinIntervalMs      = 50;
    static constexpr int FastDropIntervalMs = 80;

    explicit SpeedManager(SpeedSetting setting = SpeedSetting::Medium);

    SpeedSetting setting() const noexcept { return setting_; }
    int speedLevel() const noexcept { return speedLevel_; }
    int piecesPlaced() const noexcept { return piecesPlaced_; }
    bool fastDrop() const noexcept { return fastDrop_; }

    // Call once per entity committed to the grid.
    // Returns true when the speed level went up.
    bool onPiecePlaced();

    void setFastDrop(bool fast) noexcept { fastDrop_ = fast; }

    void reset(SpeedSetting setting);

    int baseIntervalMs() const noexcept { return baseIntervalFor(setting_); }

    // Interval after speed-ups, ignoring fast drop
    int progressiveIntervalMs() const noexcept;

    // Interval the game loop should use right now
    int gravityIntervalMs() const noexcept;

    static int baseIntervalFor(SpeedSetting setting) noexcept;

private:
    SpeedSetting setting_;
    int speedLevel_{0};
    int piecesPlaced_{0};
    bool fastDrop_{false};
};

} // namespace pillpanic::core
