#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include <array>

namespace pillpanic::core {

// Surviving half of a capsule whose partner cell was cleared.
// No orientation, never rotates.
class Fragment {
public:
    using Cells = std::array<Position, 1>;

    Fragment(PieceId id, Color color, Position position, bool userControllable = true);

    PieceId id() const noexcept { return id_; }
    Color color() const noexcept { return color_; }
    Position position() const noexcept { return position_; }
    bool isActive() const noexcept { return active_; }
    bool isUserControllable() const noexcept { return userControllable_; }

    Cells positions() const noexcept { return Cells{{position_}}; }

    bool canMove(const Grid& grid, int dx, int dy) const noexcept {
        return grid.isEmpty(position_.x + dx, position_.y + dy);
    }
    void move(int dx, int dy) noexcept;

    bool canRotate(const Grid&) const noexcept { return false; }
    void rotate(const Grid&) noexcept {}

    void place(Grid& grid);

    int lowestRow() const noexcept { return position_.y; }

private:
    PieceId id_;
    Color color_;
    Position position_;
    bool userControllable_;
    bool active_{true};
};

} // namespace pillpanic::core
