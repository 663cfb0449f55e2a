#pragma once

#include "Capsule.hpp"
#include "Fragment.hpp"
#include "FragmentGroup.hpp"
#include <variant>
#include <vector>

namespace pillpanic::core {

// Closed set of things that can be falling on the board.
// Every alternative provides the same capability members
// (positions, canMove, move, canRotate, rotate, place, ...), so the entity*
// free functions below dispatch with std::visit instead of probing types.
using FallingEntity = std::variant<Capsule, Fragment, FragmentGroup>;

inline PieceId entityId(const FallingEntity& e) noexcept {
    return std::visit([](const auto& v) { return v.id(); }, e);
}

inline bool entityIsActive(const FallingEntity& e) noexcept {
    return std::visit([](const auto& v) { return v.isActive(); }, e);
}

inline bool entityIsUserControllable(const FallingEntity& e) noexcept {
    return std::visit([](const auto& v) { return v.isUserControllable(); }, e);
}

inline bool entityCanMove(const FallingEntity& e, const Grid& grid, int dx, int dy) noexcept {
    return std::visit([&](const auto& v) { return v.canMove(grid, dx, dy); }, e);
}

inline void entityMove(FallingEntity& e, int dx, int dy) noexcept {
    std::visit([&](auto& v) { v.move(dx, dy); }, e);
}

inline bool entityCanRotate(const FallingEntity& e, const Grid& grid) noexcept {
    return std::visit([&](const auto& v) { return v.canRotate(grid); }, e);
}

inline void entityRotate(FallingEntity& e, const Grid& grid) noexcept {
    std::visit([&](auto& v) { v.rotate(grid); }, e);
}

inline void entityPlace(FallingEntity& e, Grid& grid) {
    std::visit([&](auto& v) { v.place(grid); }, e);
}

inline int entityLowestRow(const FallingEntity& e) noexcept {
    return std::visit([](const auto& v) { return v.lowestRow(); }, e);
}

inline std::vector<Position> entityPositions(const FallingEntity& e) {
    return std::visit([](const auto& v) {
        const auto cells = v.positions();
        return std::vector<Position>(cells.begin(), cells.end());
    }, e);
}

} // namespace pillpanic::core
