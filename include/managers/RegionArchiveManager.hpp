/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_ARCHIVE_MANAGER_HPP
#define REGION_ARCHIVE_MANAGER_HPP

#include "decay/DecaySimulation.hpp"
#include "managers/OwnershipTransferManager.hpp"
#include "persistence/ArchiveRecord.hpp"
#include "persistence/ArchiveStorage.hpp"
#include "persistence/EligibilityClassifier.hpp"
#include "persistence/PersistenceConfig.hpp"
#include "persistence/SaveStatistics.hpp"
#include "world/ClimateModel.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace Strata {

class ArchiveLoadSession;
class ArchiveSaveSession;
class Region;
class World;

enum class ArchiveResult : uint8_t {
  Saved,
  Restored,
  NothingToDo, // no archive for the region
  Skipped,     // missing prerequisite (storage, persistent id, region id)
  Failed
};

const char *getArchiveResultName(ArchiveResult result);

inline std::ostream &operator<<(std::ostream &os, ArchiveResult result) {
  return os << getArchiveResultName(result);
}

enum class PersistenceMode : uint8_t { Inactive, Saving, Loading };

/**
 * @brief Drives the save and load of one region archive.
 *
 * Save:  grids -> ownership transfer -> groups -> eligible entities ->
 *        corpse protection -> one session (RegionArchive + component
 *        records) -> finalize -> detach archived creatures -> statistics.
 *
 * Load:  open and validate -> wipe -> records -> components -> terrain ->
 *        ghost removal -> live targets -> resolve -> post-load init ->
 *        spawn -> side registry -> roof -> decay -> snow, pollution, fog.
 *
 * Exactly one save or load runs at a time; a nested call is refused.
 * Exceptions never leave save() or load().
 */
class RegionArchiveManager {
public:
  static constexpr const char *ARCHIVE_KIND = "RegionArchive";

  struct LoadReport {
    size_t wiped{0};
    size_t restoredEntities{0};
    size_t restoredGroups{0};
    size_t ghostsRemoved{0};
    size_t componentsLoaded{0};
    size_t containersDrained{0};
    int64_t elapsedTicks{0};
    OwnershipTransferManager::RestoreSummary sideRegistry;
    DecaySimulation::DecayReport decay;
    DecaySimulation::FailureReport failures;
    size_t floorsEroded{0};
  };

  RegionArchiveManager(World &world, const IClimateSampler &climate,
                       PersistenceConfig config);

  RegionArchiveManager(const RegionArchiveManager &) = delete;
  RegionArchiveManager &operator=(const RegionArchiveManager &) = delete;

  ArchiveResult save(Region &region);
  ArchiveResult load(Region &region);

  bool archiveExists(RegionId regionId) const;

  // Storage as currently configured; the persistent id falls back to the
  // World's when the config leaves it empty
  ArchiveStorage getStorage() const;

  EligibilityClassifier makeClassifier() const;

  PersistenceMode getMode() const { return m_mode; }
  const PersistenceConfig &getConfig() const { return m_config; }
  const DecaySimulation &getDecaySimulation() const { return m_decay; }
  OwnershipTransferManager &getOwnershipTransfer() { return m_transfer; }

  const SaveStatistics &getLastSaveStatistics() const { return m_lastSave; }
  const LoadReport &getLastLoadReport() const { return m_lastLoad; }

private:
  // Throws MissingPrerequisiteError naming the first thing missing
  void requirePrerequisites(const Region &region,
                            const ArchiveStorage &storage,
                            const char *operation) const;

  void captureGrids(const Region &region, ArchiveRecord &record) const;
  void saveComponents(const Region &region, ArchiveSaveSession &session) const;

  size_t wipe(Region &region, const EligibilityClassifier &classifier);
  size_t loadComponents(Region &region, ArchiveLoadSession &session) const;
  void applyTerrain(Region &region, const ArchiveRecord &record) const;
  size_t removeGhosts(const std::vector<EntityPtr> &archived);
  size_t drainStandingContainers(Region &region,
                                 const std::vector<EntityPtr> &archived);
  size_t spawnArchived(Region &region, const std::vector<EntityPtr> &archived);
  void applyRoof(Region &region, const ArchiveRecord &record) const;
  void applyDecay(Region &region, const ArchiveRecord &record,
                  const EligibilityClassifier &classifier, LoadReport &report);
  void applySurfaceLayers(Region &region, const ArchiveRecord &record) const;

  World &m_world;
  const IClimateSampler &m_climate;
  PersistenceConfig m_config;
  OwnershipTransferManager m_transfer;
  DecaySimulation m_decay;
  std::mt19937 m_rng;

  PersistenceMode m_mode{PersistenceMode::Inactive};
  SaveStatistics m_lastSave;
  LoadReport m_lastLoad;
};

} // namespace Strata

#endif // REGION_ARCHIVE_MANAGER_HPP
