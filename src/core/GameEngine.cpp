#include "core/GameEngine.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace pillpanic::core {

GameEngine::GameEngine(EngineConfig config,
                       std::unique_ptr<ICapsuleSource> capsules,
                       std::unique_ptr<ILevelGenerator> levels,
                       SoundCallback sound)
    : config_{config}
    , capsules_{std::move(capsules)}
    , levels_{std::move(levels)}
    , sound_{std::move(sound)}
    , callbacks_{}
    , grid_{}
    , matcher_{}
    , scoreManager_{}
    , speed_{}
    , falling_{}
    , nextColors_{}
    , status_{GameStatus::Menu}
{
    const std::uint32_t seed = config_.seed ? *config_.seed : std::random_device{}();

    if (!capsules_) {
        capsules_ = std::make_unique<CapsuleFactory>(seed, config_.batchSpawns);
    }
    if (!levels_) {
        levels_ = std::make_unique<LevelGenerator>(seed ^ 0x9E3779B9u);
    }
}

void GameEngine::setCallbacks(EngineCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void GameEngine::startGame(int level, SpeedSetting speed, std::uint64_t initialScore) {
    if (level < 1) {
        throw std::invalid_argument("GameEngine::startGame level must be at least 1");
    }

    scoreManager_.reset(initialScore);
    speed_.reset(speed);
    level_ = level;
    linesCleared_ = 0;

    grid_.clear();
    levels_->populate(grid_, level);
    infectionCount_ = grid_.countInfection();

    falling_.clear();
    nextId_ = 1;
    nextColors_ = capsules_->nextColors();
    accumulator_ = Duration{0.0};
    fallTimer_ = Duration{0.0};

    spdlog::info("Starting level {} ({} infections, base interval {} ms)",
                 level, infectionCount_, speed_.baseIntervalMs());

    changeState(GameStatus::Playing);
    spawnBatch();
    notifyStatsChange();
}

void GameEngine::pause() {
    if (status_ == GameStatus::Playing) {
        // a key release during the pause would be dropped, so do not keep the hold
        speed_.setFastDrop(false);
        changeState(GameStatus::Paused);
    }
}

void GameEngine::resume() {
    if (status_ == GameStatus::Paused) {
        changeState(GameStatus::Playing);
    }
}

void GameEngine::update(Duration elapsed) {
    if (status_ != GameStatus::Playing) {
        return;
    }

    // Cap the frame delta so a long stall does not replay seconds of gravity
    elapsed = std::clamp(elapsed, Duration{0.0}, MaxFrameDelta);
    accumulator_ += elapsed;

    while (accumulator_ >= FixedTimestep && status_ == GameStatus::Playing) {
        fixedUpdate();
        accumulator_ -= FixedTimestep;
    }
}

void GameEngine::fixedUpdate() {
    if (falling_.empty()) {
        return;
    }

    fallTimer_ += FixedTimestep;
    if (fallTimer_.count() >= static_cast<double>(fallIntervalMs())) {
        fallTimer_ = Duration{0.0};
        tick();
    }
}

void GameEngine::tick() {
    if (status_ != GameStatus::Playing || falling_.empty()) {
        return;
    }

    // An entity lands when the cell under it is committed or belongs to an
    // entity that lands in this pass; repeat until no more entities land.
    // Whatever is left moves down one row together, so falling entities never
    // overlap no matter their order in the falling set.
    std::vector<std::vector<Position>> cells;
    cells.reserve(falling_.size());
    for (const auto& entity : falling_) {
        cells.push_back(entityPositions(entity));
    }

    std::vector<bool> landed(falling_.size(), false);
    bool changed = true;
    while (changed) {
        changed = false;
        for (std::size_t i = 0; i < falling_.size(); ++i) {
            if (landed[i] || !entityIsActive(falling_[i])) {
                continue;
            }
            bool blocked = !entityCanMove(falling_[i], grid_, 0, 1);
            for (std::size_t j = 0; j < falling_.size() && !blocked; ++j) {
                if (!landed[j]) {
                    continue;
                }
                for (const auto& p : cells[i]) {
                    const Position below{p.x, p.y + 1};
                    if (std::find(cells[j].begin(), cells[j].end(), below) != cells[j].end()) {
                        blocked = true;
                        break;
                    }
                }
            }
            if (blocked) {
                landed[i] = true;
                changed = true;
            }
        }
    }

    int placed = 0;
    bool spedUp = false;
    for (std::size_t i = 0; i < falling_.size(); ++i) {
        FallingEntity& entity = falling_[i];
        if (!entityIsActive(entity)) {
            continue;
        }
        if (!landed[i]) {
            entityMove(entity, 0, 1);
            continue;
        }
        entityPlace(entity, grid_);
        ++placed;
        spedUp = speed_.onPiecePlaced() || spedUp;
        spdlog::debug("Placed entity {} (lowest row {})",
                      entityId(entity), entityLowestRow(entity));
    }

    falling_.erase(std::remove_if(falling_.begin(), falling_.end(),
                                  [](const FallingEntity& e) { return !entityIsActive(e); }),
                   falling_.end());

    notifyBoardChange();

    if (placed > 0) {
        if (spedUp) {
            spdlog::debug("Speed level {} ({} ms)", speed_.speedLevel(),
                          speed_.progressiveIntervalMs());
        }
        notifyStatsChange();
    }

    if (falling_.empty()) {
        resolveCascade();
    }
}

void GameEngine::movePill(Direction direction) {
    if (status_ != GameStatus::Playing) return;

    FallingEntity* entity = controlled();
    if (!entity) return;

    int dx = 0;
    int dy = 0;
    switch (direction) {
    case Direction::Left:  dx = -1; break;
    case Direction::Right: dx = 1;  break;
    case Direction::Down:  dy = 1;  break;
    }

    if (!canShift(*entity, dx, dy)) {
        return;
    }
    entityMove(*entity, dx, dy);
    if (direction != Direction::Down) {
        playSound(SoundEvent::Move);
    }
    notifyBoardChange();
}

void GameEngine::rotatePill() {
    if (status_ != GameStatus::Playing) return;

    FallingEntity* entity = controlled();
    if (!entity) return;

    tryRotate(*entity);
}

void GameEngine::dropPill() {
    if (status_ != GameStatus::Playing) return;

    FallingEntity* entity = controlled();
    if (!entity) return;

    bool moved = false;
    while (canShift(*entity, 0, 1)) {
        entityMove(*entity, 0, 1);
        moved = true;
    }

    if (moved) {
        playSound(SoundEvent::Drop);
        notifyBoardChange();
    }
}

void GameEngine::setFastDrop(bool fast) {
    if (status_ != GameStatus::Playing) return;
    speed_.setFastDrop(fast);
}

bool GameEngine::tapToRotate(int x, int y) {
    if (status_ != GameStatus::Playing) return false;

    for (auto& entity : falling_) {
        if (!entityIsActive(entity)) continue;

        const auto cells = entityPositions(entity);
        const bool hit = std::find(cells.begin(), cells.end(), Position{x, y}) != cells.end();
        if (!hit) continue;

        return tryRotate(entity);
    }
    return false;
}

const FallingEntity* GameEngine::controlledEntity() const noexcept {
    for (const auto& entity : falling_) {
        if (entityIsActive(entity) && entityIsUserControllable(entity)) {
            return &entity;
        }
    }
    return nullptr;
}

FallingEntity* GameEngine::controlled() noexcept {
    for (auto& entity : falling_) {
        if (entityIsActive(entity) && entityIsUserControllable(entity)) {
            return &entity;
        }
    }
    return nullptr;
}

bool GameEngine::overlapsFalling(const FallingEntity& candidate, const FallingEntity& self) const {
    const auto cells = entityPositions(candidate);
    for (const auto& other : falling_) {
        if (&other == &self || !entityIsActive(other)) {
            continue;
        }
        for (const auto& p : entityPositions(other)) {
            if (std::find(cells.begin(), cells.end(), p) != cells.end()) {
                return true;
            }
        }
    }
    return false;
}

bool GameEngine::canShift(const FallingEntity& entity, int dx, int dy) const {
    if (!entityCanMove(entity, grid_, dx, dy)) {
        return false;
    }
    FallingEntity shifted = entity;
    entityMove(shifted, dx, dy);
    return !overlapsFalling(shifted, entity);
}

bool GameEngine::tryRotate(FallingEntity& entity) {
    if (!entityCanRotate(entity, grid_)) {
        return false;
    }
    // Rotate a copy and keep it only if it clears the other falling entities
    FallingEntity rotated = entity;
    entityRotate(rotated, grid_);
    if (overlapsFalling(rotated, entity)) {
        return false;
    }
    entity = std::move(rotated);
    playSound(SoundEvent::Rotate);
    notifyBoardChange();
    return true;
}

const FallingEntity* GameEngine::entityAt(int x, int y) const {
    for (const auto& entity : falling_) {
        if (!entityIsActive(entity)) continue;

        const auto cells = entityPositions(entity);
        if (std::find(cells.begin(), cells.end(), Position{x, y}) != cells.end()) {
            return &entity;
        }
    }
    return nullptr;
}

Stats GameEngine::stats() const noexcept {
    Stats s;
    s.score = scoreManager_.score();
    s.level = level_;
    s.infectionCount = infectionCount_;
    s.linesCleared = linesCleared_;
    s.piecesPlaced = speed_.piecesPlaced();
    s.speedLevel = speed_.speedLevel();
    s.speedSetting = speed_.setting();
    return s;
}

void GameEngine::spawnBatch() {
    if (!falling_.empty()) {
        return; // only spawn onto an empty falling set
    }

    const int batchSize = std::clamp(capsules_->nextBatchSize(), 1, CapsuleFactory::MaxBatchSize);

    for (int i = 0; i < batchSize; ++i) {
        const Capsule::Colors colors = (i == 0 && nextColors_) ? *nextColors_
                                                               : capsules_->nextColors();
        const Position anchor{spawnColumn(i, batchSize), SpawnRow};
        falling_.emplace_back(Capsule{allocateId(), colors, anchor});
    }
    nextColors_ = capsules_->nextColors();

    spdlog::debug("Spawned batch of {} capsule(s)", batchSize);

    for (const auto& entity : falling_) {
        if (!entityCanMove(entity, grid_, 0, 0)) {
            gameOver();
            return;
        }
    }

    notifyBoardChange();
}

void GameEngine::spawnFragments(const std::vector<FreedFragment>& freed) {
    if (freed.empty()) {
        return;
    }

    const bool controllable = config_.controllableFragments;
    if (freed.size() == 1) {
        falling_.emplace_back(Fragment{allocateId(), freed.front().color,
                                       freed.front().position, controllable});
        return;
    }

    std::vector<Fragment> members;
    members.reserve(freed.size());
    for (const auto& f : freed) {
        members.emplace_back(allocateId(), f.color, f.position, controllable);
    }
    falling_.emplace_back(FragmentGroup{allocateId(), std::move(members), controllable});
}

void GameEngine::resolveCascade() {
    // Cells committed by a fragment group may be left hanging in their column
    if (matcher_.settle(grid_) > 0) {
        notifyBoardChange();
    }

    // Spots vacated by freed fragments stay blocked while those fragments are
    // still falling entities sitting on them
    std::vector<Position> reserved;
    int combo = 0;
    int totalCleared = 0;

    while (true) {
        MatchResult step = matcher_.processMatches(grid_, reserved);
        if (step.clearedCount == 0) {
            break;
        }

        ++combo;
        totalCleared += step.clearedCount;
        scoreManager_.addCascadeStep(step.clearedCount, combo);
        playSound(SoundEvent::Match);

        spdlog::debug("Cascade step {}: {} runs, {} cells, {} infections, {} freed",
                      combo, step.runs.size(), step.clearedCount,
                      step.infectionsCleared, step.freed.size());

        for (const auto& f : step.freed) {
            reserved.push_back(f.position);
        }
        spawnFragments(step.freed);

        notifyBoardChange();
        notifyStatsChange();
    }

    if (totalCleared > 0) {
        linesCleared_ += totalCleared / MinMatchLength;
    }

    infectionCount_ = grid_.countInfection();
    notifyStatsChange();

    if (infectionCount_ == 0) {
        levelComplete();
    } else if (falling_.empty()) {
        spawnBatch();
    }
}

void GameEngine::levelComplete() {
    scoreManager_.addLevelBonus(level_);
    playSound(SoundEvent::LevelComplete);
    changeState(GameStatus::LevelComplete);
    spdlog::info("Level {} complete, score {}", level_, scoreManager_.score());
    notifyStatsChange();
}

void GameEngine::gameOver() {
    playSound(SoundEvent::GameOver);
    changeState(GameStatus::GameOver);
    spdlog::info("Game over on level {}, score {}", level_, scoreManager_.score());
}

void GameEngine::changeState(GameStatus status) {
    spdlog::info("GameEngine state change: {} -> {}", toString(status_), toString(status));
    status_ = status;
    if (callbacks_.onStateChange) {
        callbacks_.onStateChange(status);
    }
}

void GameEngine::notifyStatsChange() {
    if (callbacks_.onStatsChange) {
        callbacks_.onStatsChange(stats());
    }
}

void GameEngine::notifyBoardChange() {
    if (callbacks_.onBoardChange) {
        callbacks_.onBoardChange();
    }
}

void GameEngine::playSound(SoundEvent event) {
    if (sound_) {
        sound_(event);
    }
}

int GameEngine::spawnColumn(int index, int batchSize) noexcept {
    // Capsules are 2 cells wide; a batch is centered with 2-cell spacing
    int start = 3;
    if (batchSize == 2) {
        start = 2;
    } else if (batchSize >= 3) {
        start = 1;
    }
    return std::clamp(start + index * 2, 0, BoardWidth - 2);
}

} // namespace pillpanic::core
