#pragma once

#include "Grid.hpp"
#include "FallingEntity.hpp"
#include "Matcher.hpp"
#include "CapsuleFactory.hpp"
#include "LevelGenerator.hpp"
#include "ScoreManager.hpp"
#include "SpeedManager.hpp"
#include "GameEvents.hpp"
#include "EngineConfig.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace pillpanic::core {

class GameEngine {
public:
    using Duration = std::chrono::duration<double, std::milli>;

    static constexpr Duration FixedTimestep{16.67};
    static constexpr Duration MaxFrameDelta{100.0};
    static constexpr int SpawnRow = 0;

    /// Null sources fall back to the seeded random CapsuleFactory / LevelGenerator.
    explicit GameEngine(EngineConfig config = {},
                        std::unique_ptr<ICapsuleSource> capsules = nullptr,
                        std::unique_ptr<ILevelGenerator> levels = nullptr,
                        SoundCallback sound = {});

    void setCallbacks(EngineCallbacks callbacks);

    // Control API for the controller / collaborators
    /// Resets stats and board, places infections and spawns the first batch.
    /// Throws std::invalid_argument when level < 1.
    void startGame(int level = 1,
                   SpeedSetting speed = SpeedSetting::Medium,
                   std::uint64_t initialScore = 0);
    void pause();
    void resume();

    /// Per-frame entry point. Clamps the delta, runs fixed sub-steps and a
    /// gravity pass whenever the fall timer reaches the fall interval.
    void update(Duration elapsed);

    /// One gravity pass over every falling entity, then cascade resolution
    /// once nothing is left falling.
    void tick();

    // Player actions, applied to controlledEntity()
    void movePill(Direction direction);
    void rotatePill();
    void dropPill();  // moves down while legal; locks on the next gravity pass
    void setFastDrop(bool fast);

    /// Rotates the capsule covering (x, y). Returns true if it rotated.
    bool tapToRotate(int x, int y);

    const Grid& board() const noexcept { return grid_; }
    const std::vector<FallingEntity>& fallingEntities() const noexcept { return falling_; }

    /// First active, user-controllable falling entity (nullptr if none)
    const FallingEntity* controlledEntity() const noexcept;

    /// Falling entity covering (x, y), if any
    const FallingEntity* entityAt(int x, int y) const;

    /// Colors of the capsule that leads the next spawn
    const std::optional<Capsule::Colors>& nextCapsule() const noexcept { return nextColors_; }

    Stats stats() const noexcept;
    GameStatus status() const noexcept { return status_; }

    int fallIntervalMs() const noexcept { return speed_.gravityIntervalMs(); }

private:
    EngineConfig config_;
    std::unique_ptr<ICapsuleSource> capsules_;
    std::unique_ptr<ILevelGenerator> levels_;
    SoundCallback sound_;
    EngineCallbacks callbacks_;

    Grid grid_;
    Matcher matcher_;
    ScoreManager scoreManager_;
    SpeedManager speed_;

    std::vector<FallingEntity> falling_;
    std::optional<Capsule::Colors> nextColors_;

    GameStatus status_{GameStatus::Menu};
    int level_{1};
    int infectionCount_{0};
    int linesCleared_{0};

    Duration accumulator_{0.0};
    Duration fallTimer_{0.0};

    PieceId nextId_{1};

    FallingEntity* controlled() noexcept;

    // True if `candidate` shares a cell with any active falling entity other than `self`
    bool overlapsFalling(const FallingEntity& candidate, const FallingEntity& self) const;
    // Grid and falling-set collision for a player move
    bool canShift(const FallingEntity& entity, int dx, int dy) const;
    bool tryRotate(FallingEntity& entity);
    void fixedUpdate();

    void spawnBatch();
    void spawnFragments(const std::vector<FreedFragment>& freed);
    void resolveCascade();

    void levelComplete();
    void gameOver();

    void changeState(GameStatus status);
    void notifyStatsChange();
    void notifyBoardChange();
    void playSound(SoundEvent event);

    PieceId allocateId() noexcept { return nextId_++; }

    static int spawnColumn(int index, int batchSize) noexcept;
};

} // namespace pillpanic::core
