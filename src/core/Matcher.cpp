#include "core/Matcher.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace pillpanic::core {

namespace {

using CellMask = std::array<bool, BoardWidth * BoardHeight>;

int maskIndex(Position p) noexcept {
    return p.y * BoardWidth + p.x;
}

bool contains(const std::vector<Position>& list, Position p) {
    return std::find(list.begin(), list.end(), p) != list.end();
}

// The other cell of the two-cell capsule owning `p`, if there is one
std::optional<Position> capsulePartner(const Grid& grid, Position p) {
    const auto cell = grid.get(p);
    if (!cell || cell->kind != CellKind::Piece || cell->owner == NoPiece) {
        return std::nullopt;
    }
    const auto owned = grid.cellsOwnedBy(cell->owner);
    if (owned.size() != 2) {
        return std::nullopt; // fragments carry an owner of their own
    }
    return owned[0] == p ? owned[1] : owned[0];
}

} // namespace

Matcher::Matcher(int minMatchLength)
    : minMatchLength_{minMatchLength}
{
    if (minMatchLength < 2) {
        throw std::invalid_argument("Matcher: minimum match length must be at least 2");
    }
}

void Matcher::scanLine(const Grid& grid, Position start, Position step, int length,
                       Orientation direction, std::vector<Run>& out) const {
    Run current{direction, Color::Red, {}};

    auto flush = [&]() {
        if (current.length() >= minMatchLength_) {
            out.push_back(current);
        }
        current.cells.clear();
    };

    Position p = start;
    for (int i = 0; i < length; ++i, p.x += step.x, p.y += step.y) {
        const Cell cell = *grid.get(p);
        if (cell.isEmpty()) {
            flush();
            continue;
        }
        if (!current.cells.empty() && cell.color != current.color) {
            flush();
        }
        current.color = cell.color;
        current.cells.push_back(p);
    }
    flush();
}

std::vector<Run> Matcher::findMatches(const Grid& grid) const {
    std::vector<Run> runs;

    for (int y = 0; y < BoardHeight; ++y) {
        scanLine(grid, Position{0, y}, Position{1, 0}, BoardWidth,
                 Orientation::Horizontal, runs);
    }
    for (int x = 0; x < BoardWidth; ++x) {
        scanLine(grid, Position{x, 0}, Position{0, 1}, BoardHeight,
                 Orientation::Vertical, runs);
    }

    return runs;
}

ClearResult Matcher::clearMatches(Grid& grid, const std::vector<Run>& runs) const {
    ClearResult result;

    CellMask cleared{};
    for (const auto& run : runs) {
        for (const auto& p : run.cells) {
            if (Grid::isInBounds(p) && !grid.isEmpty(p)) {
                cleared[maskIndex(p)] = true;
            }
        }
    }

    // Partners are collected first and marked afterwards, so a freed half is
    // never mistaken for a cleared one.
    std::vector<Position> partners;
    for (int y = 0; y < BoardHeight; ++y) {
        for (int x = 0; x < BoardWidth; ++x) {
            const Position p{x, y};
            if (!cleared[maskIndex(p)]) {
                continue;
            }
            const auto partner = capsulePartner(grid, p);
            if (partner && !cleared[maskIndex(*partner)] && !contains(partners, *partner)) {
                partners.push_back(*partner);
            }
        }
    }

    for (const auto& p : partners) {
        result.freed.push_back(FreedFragment{p, grid.get(p)->color});
        cleared[maskIndex(p)] = true;
    }

    for (int y = 0; y < BoardHeight; ++y) {
        for (int x = 0; x < BoardWidth; ++x) {
            if (!cleared[maskIndex(Position{x, y})]) {
                continue;
            }
            if (grid.get(x, y)->kind == CellKind::Infection) {
                ++result.infectionsCleared;
            }
            grid.set(x, y, Cell::empty());
            ++result.clearedCount;
        }
    }

    return result;
}

bool Matcher::applyGravity(Grid& grid, const std::vector<Position>& reserved) const {
    bool moved = false;
    std::vector<PieceId> processed;

    // Bottom row cannot fall, start one above it
    for (int y = BoardHeight - 2; y >= 0; --y) {
        for (int x = 0; x < BoardWidth; ++x) {
            const Cell cell = *grid.get(x, y);
            if (cell.kind != CellKind::Piece) {
                continue; // empty or infection
            }

            std::vector<Position> group;
            if (cell.owner == NoPiece) {
                group.push_back(Position{x, y});
            } else {
                if (std::find(processed.begin(), processed.end(), cell.owner) != processed.end()) {
                    continue;
                }
                processed.push_back(cell.owner);
                group = grid.cellsOwnedBy(cell.owner);
            }

            bool canFall = true;
            for (const auto& p : group) {
                const Position below{p.x, p.y + 1};
                if (contains(reserved, below)) {
                    canFall = false;
                    break;
                }
                const auto belowCell = grid.get(below);
                if (!belowCell) {
                    canFall = false; // floor
                    break;
                }
                if (belowCell->isEmpty()) {
                    continue;
                }
                if (cell.owner != NoPiece && belowCell->kind == CellKind::Piece
                    && belowCell->owner == cell.owner) {
                    continue; // resting on itself (vertical capsule)
                }
                canFall = false;
                break;
            }
            if (!canFall) {
                continue;
            }

            // Lift every cell first so a vertical unit does not overwrite itself
            std::vector<Cell> lifted;
            lifted.reserve(group.size());
            for (const auto& p : group) {
                lifted.push_back(*grid.get(p));
                grid.set(p, Cell::empty());
            }
            for (std::size_t i = 0; i < group.size(); ++i) {
                grid.set(group[i].x, group[i].y + 1, lifted[i]);
            }
            moved = true;
        }
    }

    return moved;
}

int Matcher::settle(Grid& grid, const std::vector<Position>& reserved) const {
    int passes = 0;
    while (applyGravity(grid, reserved)) {
        ++passes;
    }
    return passes;
}

MatchResult Matcher::processMatches(Grid& grid, const std::vector<Position>& reserved) const {
    MatchResult result;

    result.runs = findMatches(grid);
    if (result.runs.empty()) {
        return result;
    }

    ClearResult cleared = clearMatches(grid, result.runs);
    result.clearedCount = cleared.clearedCount;
    result.infectionsCleared = cleared.infectionsCleared;
    result.freed = std::move(cleared.freed);

    std::vector<Position> pinned = reserved;
    for (const auto& f : result.freed) {
        pinned.push_back(f.position);
    }
    settle(grid, pinned);

    return result;
}

} // namespace pillpanic::core
