#include "core/CapsuleFactory.hpp"
#include <random>

namespace pillpanic::core {

CapsuleFactory::CapsuleFactory(std::uint32_t seed, bool batchSpawns)
    : rng_{seed}
    , batchSpawns_{batchSpawns}
{
}

Capsule::Colors CapsuleFactory::nextColors() {
    std::uniform_int_distribution<int> dist(0, ColorCount - 1);
    const auto first = static_cast<Color>(dist(rng_));
    const auto second = static_cast<Color>(dist(rng_));
    return Capsule::Colors{{first, second}};
}

int CapsuleFactory::nextBatchSize() {
    if (!batchSpawns_) {
        return 1;
    }
    std::bernoulli_distribution batch(0.5);
    if (!batch(rng_)) {
        return 1;
    }
    std::uniform_int_distribution<int> size(1, MaxBatchSize);
    return size(rng_);
}

} // namespace pillpanic::core
