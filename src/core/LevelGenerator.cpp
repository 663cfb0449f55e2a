#include "core/LevelGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace pillpanic::core {

namespace {

// Same-colored cells in a straight line from (x, y), excluding (x, y) itself
int countDirection(const Grid& grid, int x, int y, int dx, int dy, Color color) noexcept {
    int n = 0;
    while (true) {
        const auto c = grid.get(x + dx * (n + 1), y + dy * (n + 1));
        if (!c || c->isEmpty() || c->color != color) {
            break;
        }
        ++n;
    }
    return n;
}

} // namespace

LevelGenerator::LevelGenerator(std::uint32_t seed)
    : rng_{seed}
{
}

void LevelGenerator::populate(Grid& grid, int level) {
    const int count = infectionCountFor(level);
    const int minY = topRowFor(level);
    const int maxY = BoardHeight - 1;

    std::uniform_int_distribution<int> xDist(0, BoardWidth - 1);
    std::uniform_int_distribution<int> yDist(minY, maxY);
    std::uniform_int_distribution<int> colorDist(0, ColorCount - 1);

    int placed = 0;
    for (int i = 0; i < count; ++i) {
        for (int attempt = 0; attempt < PlacementAttempts; ++attempt) {
            const int x = xDist(rng_);
            const int y = yDist(rng_);
            const auto color = static_cast<Color>(colorDist(rng_));

            if (!grid.isEmpty(x, y) || formsRun(grid, x, y, color)) {
                continue;
            }
            grid.set(x, y, Cell::infection(color));
            ++placed;
            break;
        }
    }

    if (placed < count) {
        spdlog::warn("Level {}: placed {} of {} infections", level, placed, count);
    }
    spdlog::debug("Level {}: {} infections from row {}", level, placed, minY);
}

int LevelGenerator::infectionCountFor(int level) noexcept {
    return std::clamp(InfectionsPerLevel * level, 0, MaxInfections);
}

int LevelGenerator::topRowFor(int level) noexcept {
    const double usage = std::min(0.5 + 0.02 * level, 0.85);
    return static_cast<int>(std::floor(BoardHeight * (1.0 - usage)));
}

bool LevelGenerator::formsRun(const Grid& grid, int x, int y, Color color) noexcept {
    const int horizontal = 1 + countDirection(grid, x, y, -1, 0, color)
                             + countDirection(grid, x, y, 1, 0, color);
    const int vertical = 1 + countDirection(grid, x, y, 0, -1, color)
                           + countDirection(grid, x, y, 0, 1, color);
    return horizontal >= MinMatchLength || vertical >= MinMatchLength;
}

} // namespace pillpanic::core
