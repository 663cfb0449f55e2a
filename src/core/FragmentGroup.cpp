#include "core/FragmentGroup.hpp"

#include <algorithm>
#include <utility>

namespace pillpanic::core {

FragmentGroup::FragmentGroup(PieceId id, std::vector<Fragment> fragments, bool userControllable)
    : id_{id}, fragments_{std::move(fragments)}, userControllable_{userControllable}
{
}

std::vector<Position> FragmentGroup::positions() const {
    std::vector<Position> result;
    result.reserve(fragments_.size());
    for (const auto& f : fragments_) {
        result.push_back(f.position());
    }
    return result;
}

bool FragmentGroup::canMove(const Grid& grid, int dx, int dy) const noexcept {
    return std::all_of(fragments_.begin(), fragments_.end(),
                       [&](const Fragment& f) { return f.canMove(grid, dx, dy); });
}

void FragmentGroup::move(int dx, int dy) noexcept {
    for (auto& f : fragments_) {
        f.move(dx, dy);
    }
}

void FragmentGroup::place(Grid& grid) {
    for (auto& f : fragments_) {
        f.place(grid);
    }
    active_ = false;
}

int FragmentGroup::lowestRow() const noexcept {
    int lowest = -1;
    for (const auto& f : fragments_) {
        lowest = std::max(lowest, f.position().y);
    }
    return lowest;
}

} // namespace pillpanic::core
