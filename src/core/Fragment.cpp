#include "core/Fragment.hpp"

#include <spdlog/spdlog.h>

namespace pillpanic::core {

Fragment::Fragment(PieceId id, Color color, Position position, bool userControllable)
    : id_{id}, color_{color}, position_{position}, userControllable_{userControllable}
{
}

void Fragment::move(int dx, int dy) noexcept {
    position_.x += dx;
    position_.y += dy;
}

void Fragment::place(Grid& grid) {
    if (!grid.setIfEmpty(position_, Cell::piece(color_, id_))) {
        spdlog::warn("Fragment {} placed over occupied cell ({}, {})",
                     id_, position_.x, position_.y);
    }
    active_ = false;
}

} // namespace pillpanic::core
