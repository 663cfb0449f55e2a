#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <memory>
#include <stdexcept>
#include <vector>

#include "core/GameEngine.hpp"
#include "FakeSources.hpp"

using namespace pillpanic::core;

namespace {

using Colors = Capsule::Colors;
using Placement = FakeLevelGenerator::Placement;

// One red infection in the corner keeps the level from completing
std::vector<Placement> cornerInfection() {
    return {Placement{Position{0, 15}, Cell::infection(Color::Red)}};
}

GameEngine makeEngine(std::vector<Placement> cells,
                      std::deque<Colors> script = {},
                      int batchSize = 1,
                      SoundCallback sound = {}) {
    return GameEngine{EngineConfig{},
                      std::make_unique<FakeCapsuleSource>(std::move(script),
                                                          Colors{{Color::Yellow, Color::Blue}},
                                                          batchSize),
                      std::make_unique<FakeLevelGenerator>(std::move(cells)),
                      std::move(sound)};
}

const Capsule& firstCapsule(const GameEngine& engine) {
    return std::get<Capsule>(engine.fallingEntities().front());
}

} // namespace

TEST_CASE("GameEngine: startGame enters Playing with a capsule at the spawn column", "[engine][start]")
{
    auto engine = makeEngine(cornerInfection(),
                             {Colors{{Color::Red, Color::Blue}},
                              Colors{{Color::Yellow, Color::Yellow}}});

    REQUIRE(engine.status() == GameStatus::Menu);
    REQUIRE(engine.fallingEntities().empty());

    engine.startGame(2, SpeedSetting::Low);

    REQUIRE(engine.status() == GameStatus::Playing);
    REQUIRE(engine.fallingEntities().size() == 1);

    const Capsule& capsule = firstCapsule(engine);
    CHECK(capsule.anchor() == Position{3, GameEngine::SpawnRow});
    CHECK(capsule.orientation() == Orientation::Horizontal);
    CHECK(capsule.colors() == Colors{{Color::Red, Color::Blue}});

    REQUIRE(engine.nextCapsule().has_value());
    CHECK(*engine.nextCapsule() == Colors{{Color::Yellow, Color::Yellow}});

    const Stats stats = engine.stats();
    CHECK(stats.level == 2);
    CHECK(stats.infectionCount == 1);
    CHECK(stats.score == 0);
    CHECK(stats.speedSetting == SpeedSetting::Low);
    CHECK(engine.fallIntervalMs() == 1000);

    REQUIRE(engine.controlledEntity() == &engine.fallingEntities().front());
}

TEST_CASE("GameEngine: startGame rejects levels below 1", "[engine][start]")
{
    auto engine = makeEngine(cornerInfection());

    REQUIRE_THROWS_AS(engine.startGame(0), std::invalid_argument);
    REQUIRE(engine.status() == GameStatus::Menu);
}

TEST_CASE("GameEngine: startGame passes the level to the generator and restarts cleanly", "[engine][start]")
{
    auto generator = std::make_unique<FakeLevelGenerator>(cornerInfection());
    FakeLevelGenerator* gen = generator.get();

    GameEngine engine{EngineConfig{}, std::make_unique<FakeCapsuleSource>(),
                      std::move(generator)};

    engine.startGame(4);
    engine.dropPill();
    engine.tick(); // lands and respawns

    engine.startGame(1);
    CHECK(gen->lastLevel == 1);
    CHECK(gen->populateCalls == 2);
    CHECK(engine.stats().piecesPlaced == 0);
    CHECK(engine.board().isEmpty(3, 15));
    CHECK(entityId(engine.fallingEntities().front()) == 1);
}

TEST_CASE("GameEngine: blocked spawn ends the game immediately", "[engine][gameover]")
{
    std::vector<SoundEvent> sounds;
    std::vector<GameStatus> states;

    auto engine = makeEngine({Placement{Position{3, 0}, Cell::infection(Color::Red)},
                              Placement{Position{3, 1}, Cell::infection(Color::Blue)}},
                             {}, 1,
                             [&](SoundEvent e) { sounds.push_back(e); });

    EngineCallbacks callbacks;
    callbacks.onStateChange = [&](GameStatus s) { states.push_back(s); };
    engine.setCallbacks(callbacks);

    engine.startGame();

    REQUIRE(engine.status() == GameStatus::GameOver);
    REQUIRE(states == std::vector<GameStatus>{GameStatus::Playing, GameStatus::GameOver});
    REQUIRE(sounds == std::vector<SoundEvent>{SoundEvent::GameOver});

    // Nothing moves after game over
    engine.update(GameEngine::Duration{100.0});
    engine.movePill(Direction::Left);
    REQUIRE(engine.status() == GameStatus::GameOver);
}

TEST_CASE("GameEngine: update applies gravity on the fall interval", "[engine][timing]")
{
    auto engine = makeEngine(cornerInfection());
    engine.startGame(1, SpeedSetting::Medium);
    REQUIRE(engine.fallIntervalMs() == 700);

    // 700 ms spread over 100 ms frames is 41 fixed steps, just short of a fall
    for (int i = 0; i < 7; ++i) {
        engine.update(GameEngine::Duration{100.0});
    }
    CHECK(firstCapsule(engine).anchor().y == 0);

    engine.update(GameEngine::Duration{100.0});
    CHECK(firstCapsule(engine).anchor().y == 1);

    SECTION("Long frames are clamped") {
        engine.update(GameEngine::Duration{10000.0});
        CHECK(firstCapsule(engine).anchor().y == 1);
    }

    SECTION("Paused engine does not fall") {
        engine.pause();
        REQUIRE(engine.status() == GameStatus::Paused);
        for (int i = 0; i < 50; ++i) {
            engine.update(GameEngine::Duration{100.0});
        }
        CHECK(firstCapsule(engine).anchor().y == 1);

        engine.movePill(Direction::Left);
        CHECK(firstCapsule(engine).anchor().x == 3);

        engine.resume();
        REQUIRE(engine.status() == GameStatus::Playing);
    }
}

TEST_CASE("GameEngine: fast drop shortens the interval and pause releases it", "[engine][timing]")
{
    auto engine = makeEngine(cornerInfection());
    engine.startGame();

    engine.setFastDrop(true);
    CHECK(engine.fallIntervalMs() == SpeedManager::FastDropIntervalMs);

    // 80 ms is five fixed steps
    engine.update(GameEngine::Duration{90.0});
    CHECK(firstCapsule(engine).anchor().y == 1);

    engine.pause();
    engine.resume();
    CHECK(engine.fallIntervalMs() == 700);
}

TEST_CASE("GameEngine: movement, rotation and drop respect the board", "[engine][actions]")
{
    std::vector<SoundEvent> sounds;
    auto engine = makeEngine(cornerInfection(), {}, 1,
                             [&](SoundEvent e) { sounds.push_back(e); });
    engine.startGame();

    engine.movePill(Direction::Left);
    CHECK(firstCapsule(engine).anchor() == Position{2, 0});

    engine.movePill(Direction::Down); // soft drop, silent
    CHECK(firstCapsule(engine).anchor() == Position{2, 1});

    engine.rotatePill();
    CHECK(firstCapsule(engine).orientation() == Orientation::Vertical);

    for (int i = 0; i < 5; ++i) {
        engine.movePill(Direction::Left);
    }
    CHECK(firstCapsule(engine).anchor().x == 0);

    engine.dropPill();
    // Column 0 has the infection on the bottom row
    CHECK(firstCapsule(engine).anchor() == Position{0, 13});
    CHECK(engine.fallingEntities().size() == 1); // not locked yet

    // Dropping again does nothing and stays silent
    engine.dropPill();

    REQUIRE(sounds == std::vector<SoundEvent>{SoundEvent::Move, SoundEvent::Rotate,
                                              SoundEvent::Move, SoundEvent::Move,
                                              SoundEvent::Drop});
}

TEST_CASE("GameEngine: landing commits the capsule and spawns the next", "[engine][gravity]")
{
    auto engine = makeEngine(cornerInfection(),
                             {Colors{{Color::Red, Color::Blue}},
                              Colors{{Color::Blue, Color::Blue}}});

    int boardChanges = 0;
    int statsChanges = 0;
    EngineCallbacks callbacks;
    callbacks.onBoardChange = [&]() { ++boardChanges; };
    callbacks.onStatsChange = [&](const Stats&) { ++statsChanges; };
    engine.setCallbacks(callbacks);

    engine.startGame();
    REQUIRE(statsChanges >= 1);

    engine.dropPill();
    engine.tick();

    const Grid& board = engine.board();
    REQUIRE(board.get(3, 15)->kind == CellKind::Piece);
    REQUIRE(board.get(3, 15)->color == Color::Red);
    REQUIRE(board.get(4, 15)->color == Color::Blue);
    REQUIRE(board.get(3, 15)->owner == board.get(4, 15)->owner);

    CHECK(engine.stats().piecesPlaced == 1);
    CHECK(engine.status() == GameStatus::Playing);
    REQUIRE(engine.fallingEntities().size() == 1);
    CHECK(firstCapsule(engine).colors() == Colors{{Color::Blue, Color::Blue}});
    CHECK(firstCapsule(engine).anchor() == Position{3, 0});
    CHECK(boardChanges > 0);
}

TEST_CASE("GameEngine: every falling entity gets gravity in the same pass", "[engine][gravity][batch]")
{
    // Infection under the left capsule of a batch of two
    auto engine = makeEngine({Placement{Position{2, 1}, Cell::infection(Color::Red)},
                              Placement{Position{0, 15}, Cell::infection(Color::Red)}},
                             {}, 2);
    engine.startGame();

    REQUIRE(engine.fallingEntities().size() == 2);
    CHECK(std::get<Capsule>(engine.fallingEntities()[0]).anchor() == Position{2, 0});
    CHECK(std::get<Capsule>(engine.fallingEntities()[1]).anchor() == Position{4, 0});

    engine.tick();

    // Left capsule locked in place, right one kept falling
    REQUIRE(engine.fallingEntities().size() == 1);
    CHECK(std::get<Capsule>(engine.fallingEntities()[0]).anchor() == Position{4, 1});
    CHECK(engine.board().get(2, 0)->kind == CellKind::Piece);
    CHECK(engine.board().get(3, 0)->kind == CellKind::Piece);
    CHECK(engine.stats().piecesPlaced == 1);
    CHECK(engine.status() == GameStatus::Playing);
}

TEST_CASE("GameEngine: batches of three spawn spaced across the top row", "[engine][batch]")
{
    auto engine = makeEngine(cornerInfection(), {}, 3);
    engine.startGame();

    const auto& falling = engine.fallingEntities();
    REQUIRE(falling.size() == 3);
    CHECK(std::get<Capsule>(falling[0]).anchor() == Position{1, 0});
    CHECK(std::get<Capsule>(falling[1]).anchor() == Position{3, 0});
    CHECK(std::get<Capsule>(falling[2]).anchor() == Position{5, 0});

    // Input goes to the first capsule
    REQUIRE(engine.controlledEntity() == &falling[0]);
    CHECK(engine.entityAt(6, 0) == &falling[2]);
    CHECK(engine.entityAt(0, 0) == nullptr);

    SECTION("tapToRotate turns the capsule under the tap") {
        REQUIRE(engine.tapToRotate(6, 0));
        CHECK(std::get<Capsule>(falling[2]).orientation() == Orientation::Vertical);
        CHECK(std::get<Capsule>(falling[0]).orientation() == Orientation::Horizontal);
    }

    SECTION("tapToRotate on an empty cell does nothing") {
        REQUIRE_FALSE(engine.tapToRotate(0, 5));
    }

    SECTION("A capsule cannot slide into a neighbour of the same batch") {
        engine.movePill(Direction::Right);
        CHECK(std::get<Capsule>(falling[0]).anchor() == Position{1, 0});

        engine.movePill(Direction::Left);
        CHECK(std::get<Capsule>(falling[0]).anchor() == Position{0, 0});
    }
}

TEST_CASE("GameEngine: speed goes up after ten placements", "[engine][speed]")
{
    // Alternating halves so the stack in columns 3-4 never forms a run
    std::deque<Colors> script;
    for (int i = 0; i < 12; ++i) {
        script.push_back(i % 2 == 0 ? Colors{{Color::Red, Color::Blue}}
                                    : Colors{{Color::Blue, Color::Red}});
    }
    auto engine = makeEngine(cornerInfection(), std::move(script));
    engine.startGame(1, SpeedSetting::Medium);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(engine.status() == GameStatus::Playing);
        engine.dropPill();
        engine.tick();
    }

    const Stats stats = engine.stats();
    CHECK(stats.piecesPlaced == 10);
    CHECK(stats.speedLevel == 1);
    CHECK(engine.fallIntervalMs() == 630);
    CHECK(engine.status() == GameStatus::Playing);
}

TEST_CASE("GameEngine: stacking to the top ends the game", "[engine][gameover]")
{
    std::deque<Colors> script;
    for (int i = 0; i < 20; ++i) {
        script.push_back(i % 2 == 0 ? Colors{{Color::Red, Color::Blue}}
                                    : Colors{{Color::Blue, Color::Red}});
    }
    auto engine = makeEngine(cornerInfection(), std::move(script));
    engine.startGame();

    int guard = 0;
    while (engine.status() == GameStatus::Playing && guard++ < 40) {
        engine.dropPill();
        engine.tick();
    }

    REQUIRE(engine.status() == GameStatus::GameOver);
    CHECK(engine.board().filledHeight() == BoardHeight);
}
