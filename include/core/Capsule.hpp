#pragma once // Include guard

#include "Types.hpp" // For Position, Color, Orientation
#include "Grid.hpp"
#include <array> // For std::array
#include <optional>

// Namespace for Pill Panic core types
namespace pillpanic::core {

// Two-cell player-controlled capsule.
// Horizontal: cells at anchor and anchor+(1,0).
// Vertical:   cells at anchor and anchor+(0,1).
class Capsule {
public:
    static constexpr int CellCount = 2;

    using Cells = std::array<Position, CellCount>;
    using Colors = std::array<Color, CellCount>;

    Capsule(PieceId id, Colors colors, Position anchor,
            Orientation orientation = Orientation::Horizontal);

    PieceId id() const noexcept { return id_; }
    const Colors& colors() const noexcept { return colors_; }
    Position anchor() const noexcept { return anchor_; }
    Orientation orientation() const noexcept { return orientation_; }
    bool isActive() const noexcept { return active_; }
    bool isUserControllable() const noexcept { return true; }

    void setAnchor(Position p) noexcept { anchor_ = p; }

    // Positions of the 2 cells in board coordinates; colors()[i] belongs to positions()[i]
    Cells positions() const noexcept;

    bool canMove(const Grid& grid, int dx, int dy) const noexcept;
    void move(int dx, int dy) noexcept;

    bool canRotate(const Grid& grid) const noexcept;

    // Toggles orientation using the first legal kick; no-op when none is legal.
    // Going from vertical back to horizontal swaps the two colors.
    void rotate(const Grid& grid) noexcept;

    void place(Grid& grid);

    int lowestRow() const noexcept;

private:
    PieceId id_;
    Colors colors_;
    Position anchor_;
    Orientation orientation_;
    bool active_{true};

    // Offset applied to the anchor when the rotated cells do not fit in place
    std::optional<Position> findRotationKick(const Grid& grid) const noexcept;

    static Cells cellsFor(Position anchor, Orientation orientation) noexcept;
};

} // namespace pillpanic::core
