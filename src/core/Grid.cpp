#include "core/Grid.hpp"

namespace pillpanic::core {

bool operator==(const Cell& a, const Cell& b) noexcept {
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
    case CellKind::Empty:
        return true;
    case CellKind::Infection:
        return a.color == b.color;
    case CellKind::Piece:
        return a.color == b.color && a.owner == b.owner;
    }
    return false;
}

Grid::Grid()
{
    clear();
}

std::optional<Cell> Grid::get(int x, int y) const noexcept {
    if (!isInBounds(x, y)) {
        return std::nullopt;
    }
    return cells_[index(x, y)];
}

void Grid::set(int x, int y, const Cell& cell) noexcept {
    if (!isInBounds(x, y)) {
        return;
    }
    cells_[index(x, y)] = cell;
}

bool Grid::setIfEmpty(Position p, const Cell& cell) noexcept {
    if (!isEmpty(p)) {
        return false;
    }
    cells_[index(p.x, p.y)] = cell;
    return true;
}

bool Grid::isEmpty(int x, int y) const noexcept {
    if (!isInBounds(x, y)) {
        return false; // the walls and floor are never empty
    }
    return cells_[index(x, y)].isEmpty();
}

int Grid::countInfection() const noexcept {
    int count = 0;
    for (const auto& c : cells_) {
        if (c.kind == CellKind::Infection) {
            ++count;
        }
    }
    return count;
}

std::vector<Position> Grid::cellsOwnedBy(PieceId owner) const {
    std::vector<Position> result;
    if (owner == NoPiece) {
        return result;
    }
    for (int y = 0; y < BoardHeight; ++y) {
        for (int x = 0; x < BoardWidth; ++x) {
            const Cell& c = cells_[index(x, y)];
            if (c.kind == CellKind::Piece && c.owner == owner) {
                result.push_back(Position{x, y});
            }
        }
    }
    return result;
}

int Grid::filledHeight() const noexcept {
    for (int y = 0; y < BoardHeight; ++y) {
        for (int x = 0; x < BoardWidth; ++x) {
            if (!cells_[index(x, y)].isEmpty()) {
                return BoardHeight - y;
            }
        }
    }
    return 0;
}

void Grid::clear() noexcept {
    cells_.fill(Cell::empty());
}

} // namespace pillpanic::core
