#pragma once

#include <cstdint>
#include <optional>

namespace pillpanic::core {

struct EngineConfig {
    std::optional<std::uint32_t> seed;  // random_device when absent
    bool batchSpawns{true};             // allow 1-3 capsules per spawn
    bool controllableFragments{true};   // freed fragments accept player commands
};

} // namespace pillpanic::core
