#include "core/ScoreManager.hpp"

namespace pillpanic::core {

void ScoreManager::addCascadeStep(int cleared, int combo) {
    if (cleared <= 0 || combo <= 0) return;

    score_ += static_cast<std::uint64_t>(cleared) * PointsPerCell
            * static_cast<std::uint64_t>(combo);
}

void ScoreManager::addLevelBonus(int level) {
    if (level <= 0) return;

    score_ += LevelBonusPerLevel * static_cast<std::uint64_t>(level);
}

} // namespace pillpanic::core
