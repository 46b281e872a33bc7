/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/PersistenceConfig.hpp"
#include "core/Logger.hpp"
#include "managers/PersistenceSettings.hpp"
#include <algorithm>
#include <sstream>

namespace Strata {

std::unordered_set<std::string> PersistenceConfig::parseDefList(const std::string& text)
{
    std::unordered_set<std::string> defs;
    std::istringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ',')) {
        const auto first = token.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = token.find_last_not_of(" \t");
        defs.insert(token.substr(first, last - first + 1));
    }
    return defs;
}

PersistenceConfig PersistenceConfig::fromSettings(const PersistenceSettings& settings)
{
    PersistenceConfig config;
    config.storageRoot = settings.get<std::string>("storage", "root", "");
    config.persistentId = settings.get<std::string>("storage", "persistent_id", "");
    config.excludedDefs = parseDefList(settings.get<std::string>("eligibility", "excluded_defs", "void_monolith"));

    config.decay.enabled = settings.get<bool>("decay", "enabled", true);
    config.decay.rainfallReference = settings.get<float>("decay", "rainfall_reference", 4000.0f);
    config.decay.maxFailureEvents =
        std::clamp(settings.get<int>("decay", "max_failure_events", FAILURE_EVENT_CAP), 0, FAILURE_EVENT_CAP);
    config.decay.failureMtbDays = settings.get<float>("decay", "failure_mtb_days", 300.0f);
    config.decaySeed = static_cast<uint32_t>(std::max(0, settings.get<int>("decay", "seed", 0)));
    config.restoreSearchRadius = std::max(0, settings.get<int>("restore", "search_radius", 8));

    if (config.decay.rainfallReference <= 0.0f) {
        SETTINGS_WARNING("decay.rainfall_reference must be positive; using 4000");
        config.decay.rainfallReference = 4000.0f;
    }
    return config;
}

} // namespace Strata
