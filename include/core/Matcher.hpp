#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include <vector>

namespace pillpanic::core {

// Maximal line of same-colored occupied cells
struct Run {
    Orientation direction{Orientation::Horizontal};
    Color color{Color::Red};
    std::vector<Position> cells; // in scan order (left->right or top->bottom)

    int length() const noexcept { return static_cast<int>(cells.size()); }
};

// Surviving half of a capsule whose partner was cleared.
// Its grid cell is emptied; the engine turns it into a falling Fragment.
struct FreedFragment {
    Position position;
    Color color{Color::Red};
};

struct ClearResult {
    int clearedCount{0};      // cells emptied, freed halves included
    int infectionsCleared{0};
    std::vector<FreedFragment> freed;
};

struct MatchResult {
    int clearedCount{0};
    int infectionsCleared{0};
    std::vector<Run> runs;
    std::vector<FreedFragment> freed;
};

class Matcher {
public:
    explicit Matcher(int minMatchLength = MinMatchLength);

    int minMatchLength() const noexcept { return minMatchLength_; }

    // Every qualifying run: rows scanned left to right, then columns top to
    // bottom. A cell may appear in one horizontal and one vertical run.
    std::vector<Run> findMatches(const Grid& grid) const;

    // Empties the union of the run cells plus any capsule half whose partner
    // is in that union.
    ClearResult clearMatches(Grid& grid, const std::vector<Run>& runs) const;

    // One bottom-to-top gravity pass. Cells sharing an owner fall as a rigid
    // unit; infections never fall; reserved positions block like occupied
    // cells. Returns true if anything moved.
    bool applyGravity(Grid& grid, const std::vector<Position>& reserved = {}) const;

    // Repeats applyGravity until nothing moves. Returns the number of passes
    // that moved something.
    int settle(Grid& grid, const std::vector<Position>& reserved = {}) const;

    // find -> clear -> gravity to a fixed point, once. Freed positions from
    // this step are pinned during gravity together with `reserved`.
    // Leaves the grid untouched when nothing qualifies.
    MatchResult processMatches(Grid& grid, const std::vector<Position>& reserved = {}) const;

private:
    int minMatchLength_;

    void scanLine(const Grid& grid, Position start, Position step, int length,
                  Orientation direction, std::vector<Run>& out) const;
};

} // namespace pillpanic::core
