#pragma once

#include "Types.hpp"
#include "Capsule.hpp"
#include <cstdint>
#include <random>

namespace pillpanic::core {

// Where new capsules come from. The engine asks for a batch size at every
// spawn and then for one color pair per capsule in the batch.
class ICapsuleSource {
public:
    virtual ~ICapsuleSource() = default;

    virtual Capsule::Colors nextColors() = 0;

    // Number of capsules to drop together, 1..MaxBatchSize
    virtual int nextBatchSize() = 0;
};

class CapsuleFactory : public ICapsuleSource {
public:
    static constexpr int MaxBatchSize = 3;

    explicit CapsuleFactory(std::uint32_t seed, bool batchSpawns = true);

    Capsule::Colors nextColors() override;

    // Half of the spawns drop a batch of 1-3 capsules when batching is on
    int nextBatchSize() override;

private:
    std::mt19937 rng_;
    bool batchSpawns_;
};

} // namespace pillpanic::core
