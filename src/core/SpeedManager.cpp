#include "core/SpeedManager.hpp"
#include <algorithm>
#include <cmath>

namespace pillpanic::core {

SpeedManager::SpeedManager(SpeedSetting setting)
    : setting_{setting}
{
}

bool SpeedManager::onPiecePlaced() {
    ++piecesPlaced_;

    const int newLevel = std::min(piecesPlaced_ / PiecesPerSpeedUp, MaxSpeedUps);
    if (newLevel > speedLevel_) {
        speedLevel_ = newLevel;
        return true;
    }
    return false;
}

void SpeedManager::reset(SpeedSetting setting) {
    setting_ = setting;
    speedLevel_ = 0;
    piecesPlaced_ = 0;
    fastDrop_ = false;
}

int SpeedManager::progressiveIntervalMs() const noexcept {
    const double scaled = baseIntervalMs() * std::pow(SpeedUpFactor, speedLevel_);
    return std::max(MinIntervalMs, static_cast<int>(std::floor(scaled)));
}

int SpeedManager::gravityIntervalMs() const noexcept {
    return fastDrop_ ? FastDropIntervalMs : progressiveIntervalMs();
}

int SpeedManager::baseIntervalFor(SpeedSetting setting) noexcept {
    switch (setting) {
    case SpeedSetting::Low:    return 1000;
    case SpeedSetting::Medium: return 700;
    case SpeedSetting::High:   return 450;
    }
    return 700;
}

} // namespace pillpanic::core
