/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERSISTENCE_CONFIG_HPP
#define PERSISTENCE_CONFIG_HPP

#include "decay/DecayContext.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>

namespace Strata {

class PersistenceSettings;

/**
 * @brief Snapshot of the persistence settings taken when a manager is built.
 */
struct PersistenceConfig {
    std::string storageRoot;   // empty: platform preference path
    std::string persistentId;  // empty: taken from the World
    std::unordered_set<std::string> excludedDefs{"void_monolith"};
    DecayTuning decay;
    uint32_t decaySeed{0};     // 0: seed from std::random_device
    int restoreSearchRadius{8};

    static PersistenceConfig fromSettings(const PersistenceSettings& settings);

    // Splits "a, b,c" into {"a", "b", "c"}; blanks are dropped
    static std::unordered_set<std::string> parseDefList(const std::string& text);
};

} // namespace Strata

#endif // PERSISTENCE_CONFIG_HPP
