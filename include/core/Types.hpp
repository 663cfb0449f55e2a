#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for Pill Panic core types
namespace pillpanic::core {

// Board dimensions are fixed for every level
constexpr int BoardWidth  = 8;
constexpr int BoardHeight = 16;

// Shortest run of same-colored cells that clears
constexpr int MinMatchLength = 4;

// Position of a cell on the grid (origin top-left, y grows downward)
struct Position {
    int x{};
    int y{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Identity tag written into grid cells by a placed entity. 0 means "no owner".
using PieceId = std::uint32_t;
constexpr PieceId NoPiece = 0;

enum class Color : std::uint8_t {
    Red,
    Blue,
    Yellow
};

constexpr int ColorCount = 3;

enum class Orientation : std::uint8_t {
    Horizontal,
    Vertical
};

enum class Direction : std::uint8_t {
    Left,
    Right,
    Down
};

// Starting fall interval, picked by the player before a level
enum class SpeedSetting : std::uint8_t {
    Low,
    Medium,
    High
};

} // namespace pillpanic::core
