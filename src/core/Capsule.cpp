#include "core/Capsule.hpp"

#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace pillpanic::core {

namespace {

// Kick tables, tried in order. Horizontal -> vertical may shift one row up
// (capsule resting on the floor); vertical -> horizontal may shift one column
// left (capsule against the right wall).
constexpr std::array<Position, 2> ToVerticalKicks{{
    {0, 0}, {0, -1}
}};

constexpr std::array<Position, 2> ToHorizontalKicks{{
    {0, 0}, {-1, 0}
}};

Orientation toggled(Orientation o) noexcept {
    return o == Orientation::Horizontal ? Orientation::Vertical
                                        : Orientation::Horizontal;
}

} // namespace

Capsule::Capsule(PieceId id, Colors colors, Position anchor, Orientation orientation)
    : id_{id}, colors_{colors}, anchor_{anchor}, orientation_{orientation}
{
}

Capsule::Cells Capsule::positions() const noexcept {
    return cellsFor(anchor_, orientation_);
}

bool Capsule::canMove(const Grid& grid, int dx, int dy) const noexcept {
    for (const auto& p : positions()) {
        if (!grid.isEmpty(p.x + dx, p.y + dy)) {
            return false; // wall, floor or committed cell
        }
    }
    return true;
}

void Capsule::move(int dx, int dy) noexcept {
    anchor_.x += dx;
    anchor_.y += dy;
}

bool Capsule::canRotate(const Grid& grid) const noexcept {
    return findRotationKick(grid).has_value();
}

void Capsule::rotate(const Grid& grid) noexcept {
    auto kick = findRotationKick(grid);
    if (!kick) {
        return;
    }

    if (orientation_ == Orientation::Vertical) {
        std::swap(colors_[0], colors_[1]);
    }
    orientation_ = toggled(orientation_);
    anchor_.x += kick->x;
    anchor_.y += kick->y;
}

void Capsule::place(Grid& grid) {
    const auto cells = positions();
    for (int i = 0; i < CellCount; ++i) {
        if (!grid.setIfEmpty(cells[i], Cell::piece(colors_[i], id_))) {
            spdlog::warn("Capsule {} placed over occupied cell ({}, {})",
                         id_, cells[i].x, cells[i].y);
        }
    }
    active_ = false;
}

int Capsule::lowestRow() const noexcept {
    const auto cells = positions();
    return std::max(cells[0].y, cells[1].y);
}

std::optional<Position> Capsule::findRotationKick(const Grid& grid) const noexcept {
    const Orientation target = toggled(orientation_);
    const auto& kicks = (target == Orientation::Vertical) ? ToVerticalKicks
                                                          : ToHorizontalKicks;

    for (const auto& k : kicks) {
        const Position kicked{anchor_.x + k.x, anchor_.y + k.y};
        bool fits = true;
        for (const auto& p : cellsFor(kicked, target)) {
            if (!grid.isEmpty(p)) {
                fits = false;
                break;
            }
        }
        if (fits) {
            return k;
        }
    }
    return std::nullopt;
}

Capsule::Cells Capsule::cellsFor(Position anchor, Orientation orientation) noexcept {
    if (orientation == Orientation::Horizontal) {
        return Cells{{ anchor, {anchor.x + 1, anchor.y} }};
    }
    return Cells{{ anchor, {anchor.x, anchor.y + 1} }};
}

} // namespace pillpanic::core
