#include <catch2/catch_test_macros.hpp>

#include "core/FallingEntity.hpp"
#include "core/Fragment.hpp"
#include "core/FragmentGroup.hpp"
#include "core/Grid.hpp"

using namespace pillpanic::core;

TEST_CASE("Fragment moves, never rotates, places under its own id", "[fragment]") {
    Grid g;
    Fragment f{9, Color::Yellow, Position{5, 14}};

    REQUIRE(f.canMove(g, 0, 1));
    REQUIRE_FALSE(f.canRotate(g));

    f.move(0, 1);
    REQUIRE_FALSE(f.canMove(g, 0, 1)); // floor

    f.rotate(g);
    REQUIRE(f.position() == Position{5, 15});

    f.place(g);
    REQUIRE_FALSE(f.isActive());
    REQUIRE(g.get(5, 15)->owner == 9);
    REQUIRE(g.get(5, 15)->color == Color::Yellow);
}

TEST_CASE("FragmentGroup moves all-or-nothing", "[fragment][group]") {
    Grid g;
    FragmentGroup group{20, {Fragment{21, Color::Red, Position{1, 10}},
                             Fragment{22, Color::Blue, Position{4, 12}}}};

    REQUIRE(group.canMove(g, 0, 1));
    REQUIRE(group.lowestRow() == 12);

    // Block only one member
    g.set(4, 13, Cell::infection(Color::Red));
    REQUIRE_FALSE(group.canMove(g, 0, 1));
    REQUIRE(group.canMove(g, 1, 0));

    group.move(1, 0);
    auto cells = group.positions();
    REQUIRE(cells[0] == Position{2, 10});
    REQUIRE(cells[1] == Position{5, 12});
}

TEST_CASE("FragmentGroup place commits every member with its own identity", "[fragment][group]") {
    Grid g;
    FragmentGroup group{20, {Fragment{21, Color::Red, Position{1, 15}},
                             Fragment{22, Color::Blue, Position{6, 15}}}};

    group.place(g);

    REQUIRE_FALSE(group.isActive());
    REQUIRE(g.get(1, 15)->owner == 21);
    REQUIRE(g.get(6, 15)->owner == 22);
}

TEST_CASE("FallingEntity dispatch exposes the capability set", "[fragment][entity]") {
    Grid g;

    FallingEntity capsule = Capsule{1, Capsule::Colors{{Color::Red, Color::Red}}, Position{3, 0}};
    FallingEntity fragment = Fragment{2, Color::Blue, Position{0, 0}};
    FallingEntity group = FragmentGroup{3, {Fragment{4, Color::Yellow, Position{7, 0}}}};

    REQUIRE(entityCanRotate(capsule, g));
    REQUIRE_FALSE(entityCanRotate(fragment, g));
    REQUIRE_FALSE(entityCanRotate(group, g));

    REQUIRE(entityPositions(capsule).size() == 2);
    REQUIRE(entityPositions(fragment).size() == 1);
    REQUIRE(entityPositions(group).size() == 1);

    REQUIRE(entityId(group) == 3);

    entityMove(fragment, 0, 3);
    REQUIRE(entityLowestRow(fragment) == 3);

    entityPlace(capsule, g);
    REQUIRE_FALSE(entityIsActive(capsule));
    REQUIRE(g.get(4, 0)->owner == 1);
}
