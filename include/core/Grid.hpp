#pragma once

#include "Types.hpp"
#include <array>
#include <optional>
#include <vector>

namespace pillpanic::core {

enum class CellKind : std::uint8_t {
    Empty,
    Infection,
    Piece
};

struct Cell {
    CellKind kind{CellKind::Empty};
    Color color{Color::Red}; // meaningless for Empty cells
    PieceId owner{NoPiece};  // only set for Piece cells

    static Cell empty() noexcept { return Cell{}; }
    static Cell infection(Color c) noexcept { return Cell{CellKind::Infection, c, NoPiece}; }
    static Cell piece(Color c, PieceId owner) noexcept { return Cell{CellKind::Piece, c, owner}; }

    bool isEmpty() const noexcept { return kind == CellKind::Empty; }
};

bool operator==(const Cell& a, const Cell& b) noexcept;
inline bool operator!=(const Cell& a, const Cell& b) noexcept { return !(a == b); }

// Fixed-size cell matrix. All queries are bounds-checked and never throw:
// reading outside the board yields an empty optional, which is distinct from
// an Empty cell, so movement checks treat walls and collisions the same way.
class Grid {
public:
    Grid();

    int width() const noexcept { return BoardWidth; }
    int height() const noexcept { return BoardHeight; }

    std::optional<Cell> get(int x, int y) const noexcept;
    std::optional<Cell> get(Position p) const noexcept { return get(p.x, p.y); }

    // Writes outside the board are ignored
    void set(int x, int y, const Cell& cell) noexcept;
    void set(Position p, const Cell& cell) noexcept { set(p.x, p.y, cell); }

    // Writes only into an in-bounds Empty cell; returns false otherwise
    bool setIfEmpty(Position p, const Cell& cell) noexcept;

    bool isEmpty(int x, int y) const noexcept;
    bool isEmpty(Position p) const noexcept { return isEmpty(p.x, p.y); }

    static bool isInBounds(int x, int y) noexcept {
        return x >= 0 && x < BoardWidth && y >= 0 && y < BoardHeight;
    }
    static bool isInBounds(Position p) noexcept { return isInBounds(p.x, p.y); }

    int countInfection() const noexcept;

    // Every Piece cell tagged with the given owner, in row-major order
    std::vector<Position> cellsOwnedBy(PieceId owner) const;

    // Number of rows from the topmost occupied row down to the floor (0 when empty)
    int filledHeight() const noexcept;

    void clear() noexcept;

private:
    std::array<Cell, BoardWidth * BoardHeight> cells_;

    static int index(int x, int y) noexcept {
        return y * BoardWidth + x;
    }
};

} // namespace pillpanic::core
