#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include <cstdint>
#include <random>

namespace pillpanic::core {

// Fills a freshly cleared grid with the infection cells of a level
class ILevelGenerator {
public:
    virtual ~ILevelGenerator() = default;

    virtual void populate(Grid& grid, int level) = 0;
};

// Random infections in the lower part of the board. Higher levels get more
// infections spread over more rows, both capped.
class LevelGenerator : public ILevelGenerator {
public:
    static constexpr int InfectionsPerLevel = 4;
    static constexpr int MaxInfections      = 84;
    static constexpr int PlacementAttempts  = 200;

    explicit LevelGenerator(std::uint32_t seed);

    void populate(Grid& grid, int level) override;

    static int infectionCountFor(int level) noexcept;

    // First row infections may occupy at this level
    static int topRowFor(int level) noexcept;

private:
    std::mt19937 rng_;

    // True if writing `color` at (x, y) would complete a clearing run
    static bool formsRun(const Grid& grid, int x, int y, Color color) noexcept;
};

} // namespace pillpanic::core
