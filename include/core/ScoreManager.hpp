#pragma once

#include <cstdint>

namespace pillpanic::core {

class ScoreManager {
public:
    static constexpr std::uint64_t PointsPerCell = 100;
    static constexpr std::uint64_t LevelBonusPerLevel = 1000;

    // One cascade step: cleared * 100 * combo, combo counts from 1
    void addCascadeStep(int cleared, int combo);

    void addLevelBonus(int level);

    std::uint64_t score() const noexcept { return score_; }

    void reset(std::uint64_t initialScore = 0) noexcept { score_ = initialScore; }

private:
    std::uint64_t score_{0};
};

} // namespace pillpanic::core
