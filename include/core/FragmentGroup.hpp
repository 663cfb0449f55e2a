#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include "Fragment.hpp"
#include <vector>

namespace pillpanic::core {

// Fragments freed by the same clear, falling as one rigid unit.
// The group tests, moves and places all-or-nothing; each member keeps its own
// color, position and commit identity.
class FragmentGroup {
public:
    FragmentGroup(PieceId id, std::vector<Fragment> fragments, bool userControllable = true);

    PieceId id() const noexcept { return id_; }
    const std::vector<Fragment>& fragments() const noexcept { return fragments_; }
    bool isActive() const noexcept { return active_; }
    bool isUserControllable() const noexcept { return userControllable_; }

    std::vector<Position> positions() const;

    bool canMove(const Grid& grid, int dx, int dy) const noexcept;
    void move(int dx, int dy) noexcept;

    bool canRotate(const Grid&) const noexcept { return false; }
    void rotate(const Grid&) noexcept {}

    void place(Grid& grid);

    // Largest y among the members (-1 for an empty group)
    int lowestRow() const noexcept;

private:
    PieceId id_;
    std::vector<Fragment> fragments_;
    bool userControllable_;
    bool active_{true};
};

} // namespace pillpanic::core
