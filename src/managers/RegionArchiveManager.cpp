/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RegionArchiveManager.hpp"
#include "core/Logger.hpp"
#include "core/PersistenceError.hpp"
#include "entities/Corpse.hpp"
#include "persistence/ArchiveSession.hpp"
#include "persistence/GridCodec.hpp"
#include "world/Region.hpp"
#include "world/World.hpp"
#include <unordered_set>

namespace Strata {

namespace {

// Resets the persistence mode however the operation ends
class PersistenceModeGuard {
public:
  PersistenceModeGuard(PersistenceMode &mode, PersistenceMode active)
      : m_mode(mode) {
    m_mode = active;
  }
  ~PersistenceModeGuard() { m_mode = PersistenceMode::Inactive; }

  PersistenceModeGuard(const PersistenceModeGuard &) = delete;
  PersistenceModeGuard &operator=(const PersistenceModeGuard &) = delete;

private:
  PersistenceMode &m_mode;
};

class RestorationGuard {
public:
  explicit RestorationGuard(Region &region) : m_region(region) {
    m_region.setRestorationInProgress(true);
  }
  ~RestorationGuard() { m_region.setRestorationInProgress(false); }

  RestorationGuard(const RestorationGuard &) = delete;
  RestorationGuard &operator=(const RestorationGuard &) = delete;

private:
  Region &m_region;
};

const char *getModeName(PersistenceMode mode) {
  switch (mode) {
  case PersistenceMode::Inactive:
    return "inactive";
  case PersistenceMode::Saving:
    return "saving";
  case PersistenceMode::Loading:
    return "loading";
  }
  return "unknown";
}

std::string describeRegion(const Region &region) {
  return "region " + std::to_string(region.getId());
}

void collectCreatureIds(const EntityPtr &entity,
                        std::unordered_set<EntityID> &out) {
  if (!entity) {
    return;
  }
  if (entity->getCategory() == EntityCategory::Creature) {
    out.insert(entity->getID());
  }
  if (auto structure = std::dynamic_pointer_cast<Structure>(entity)) {
    for (const auto &held : structure->getContents()) {
      collectCreatureIds(held, out);
    }
  }
}

} // namespace

const char *getArchiveResultName(ArchiveResult result) {
  switch (result) {
  case ArchiveResult::Saved:
    return "Saved";
  case ArchiveResult::Restored:
    return "Restored";
  case ArchiveResult::NothingToDo:
    return "NothingToDo";
  case ArchiveResult::Skipped:
    return "Skipped";
  case ArchiveResult::Failed:
    return "Failed";
  }
  return "Unknown";
}

RegionArchiveManager::RegionArchiveManager(World &world,
                                           const IClimateSampler &climate,
                                           PersistenceConfig config)
    : m_world(world), m_climate(climate), m_config(std::move(config)),
      m_transfer(world, m_config.restoreSearchRadius),
      m_decay(climate, m_config.decay) {
  if (m_config.decaySeed != 0) {
    m_rng.seed(m_config.decaySeed);
  } else {
    std::random_device device;
    m_rng.seed(device());
  }
}

ArchiveStorage RegionArchiveManager::getStorage() const {
  const std::string &persistentId = m_config.persistentId.empty()
                                        ? m_world.getPersistentId()
                                        : m_config.persistentId;
  return ArchiveStorage(m_config.storageRoot, persistentId);
}

EligibilityClassifier RegionArchiveManager::makeClassifier() const {
  return EligibilityClassifier(m_world.getRegistry(), m_config.excludedDefs);
}

bool RegionArchiveManager::archiveExists(RegionId regionId) const {
  if (regionId == INVALID_REGION_ID) {
    return false;
  }
  const ArchiveStorage storage = getStorage();
  return storage.isConfigured() && storage.regionArchiveExists(regionId);
}

void RegionArchiveManager::requirePrerequisites(
    const Region &region, const ArchiveStorage &storage,
    const char *operation) const {
  if (region.getId() == INVALID_REGION_ID) {
    throw MissingPrerequisiteError(std::string("cannot ") + operation +
                                   " a region without an id");
  }
  if (storage.getPersistentId().empty()) {
    throw MissingPrerequisiteError(std::string("cannot ") + operation + " " +
                                   describeRegion(region) +
                                   ": no persistent id");
  }
  if (storage.getRoot().empty()) {
    throw MissingPrerequisiteError(std::string("cannot ") + operation + " " +
                                   describeRegion(region) +
                                   ": no storage root");
  }
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

ArchiveResult RegionArchiveManager::save(Region &region) {
  if (m_mode != PersistenceMode::Inactive) {
    ARCHIVE_ERROR("Refusing to save " + describeRegion(region) +
                  " while persistence is " + getModeName(m_mode));
    return ArchiveResult::Failed;
  }

  const ArchiveStorage storage = getStorage();
  try {
    requirePrerequisites(region, storage, "save");
  } catch (const MissingPrerequisiteError &e) {
    ARCHIVE_ERROR(e.what());
    return ArchiveResult::Skipped;
  }
  if (!storage.ensureFolder()) {
    return ArchiveResult::Failed;
  }

  PersistenceModeGuard modeGuard(m_mode, PersistenceMode::Saving);

  ArchiveRecord record;
  bool extracted = false;
  bool finalized = false;

  try {
    record.abandonedAtTick = m_world.getClock().getTicksGame();
    captureGrids(region, record);

    extracted = true;
    const auto extraction = m_transfer.extractForArchive(region);
    record.groupLeaders = m_transfer.collectGroupControllers(region);

    const EligibilityClassifier classifier = makeClassifier();
    for (const auto &entity : region.getEntities()) {
      if (classifier.shouldPersist(*entity)) {
        record.entities.push_back(entity);
      }
    }

    m_transfer.protectCorpseInnerCreatures(record.entities);

    const std::string path = storage.getRegionArchivePath(region.getId());
    {
      ArchiveSaveSession session(path, ARCHIVE_KIND);
      session.writeRecord(ArchiveRecord::RECORD_NAME,
                          [&record](ArchiveWriter &writer) {
                            record.save(writer);
                          });
      saveComponents(region, session);
      session.finalize();
      finalized = true;
    }

    const size_t detached = m_transfer.detachArchivedCreatures(
        region, record.entities, record.groupLeaders);

    const SideRegistryEntry *entry =
        m_world.getSideTable().tryGet(region.getId());
    m_lastSave = SaveStatistics::collect(
        path, record, entry ? *entry : SideRegistryEntry{},
        OwnershipTransferManager::corpseInnerCreatures(record.entities));

    ARCHIVE_INFO("Saved " + describeRegion(region) + " at tick " +
                 std::to_string(record.abandonedAtTick) + ": " +
                 std::to_string(record.entities.size()) + " entities, " +
                 std::to_string(record.groupLeaders.size()) + " groups, " +
                 std::to_string(extraction.total()) + " creatures parked, " +
                 std::to_string(detached) + " creatures detached");
    ARCHIVE_INFO(m_lastSave.describe());
    return ArchiveResult::Saved;
  } catch (const PersistenceError &e) {
    ARCHIVE_ERROR("Save of " + describeRegion(region) +
                  " failed: " + e.what());
  } catch (const std::exception &e) {
    ARCHIVE_ERROR("Unexpected error saving " + describeRegion(region) + ": " +
                  e.what());
  }

  // Nothing reached the disk: put the extracted creatures back
  if (extracted && !finalized) {
    m_transfer.releaseCorpseInnerCreatures(record.entities);
    try {
      m_transfer.rollbackExtraction(region, m_rng);
    } catch (const std::exception &e) {
      ARCHIVE_ERROR("Could not return parked creatures to " +
                    describeRegion(region) + ": " + e.what());
    }
  }
  return ArchiveResult::Failed;
}

void RegionArchiveManager::captureGrids(const Region &region,
                                        ArchiveRecord &record) const {
  record.terrain = GridCodec::serializeU16(
      region, [&region](const CellPos &c) { return region.getTerrain(c); });
  record.underTerrain = GridCodec::serializeU16(
      region,
      [&region](const CellPos &c) { return region.getUnderTerrain(c); });
  record.roof = GridCodec::serializeU16(
      region, [&region](const CellPos &c) { return region.getRoof(c); });
  record.snow = GridCodec::serializeU8(
      region, [&region](const CellPos &c) { return region.getSnowDepth(c); });
  if (region.hasPollutionFeature()) {
    record.pollution =
        GridCodec::serializeU8(region, [&region](const CellPos &c) {
          return static_cast<uint8_t>(region.isPolluted(c) ? 1 : 0);
        });
  }
  record.fog = GridCodec::serializeU8(region, [&region](const CellPos &c) {
    return static_cast<uint8_t>(region.isFogged(c) ? 1 : 0);
  });
}

void RegionArchiveManager::saveComponents(const Region &region,
                                          ArchiveSaveSession &session) const {
  for (const auto &component : region.getComponents()) {
    auto persistable =
        std::dynamic_pointer_cast<IPersistableRegionComponent>(component);
    if (!persistable) {
      continue;
    }
    const std::string recordName =
        sanitizeComponentRecordName(persistable->getArchiveTag());
    session.writeRecord(recordName, [&persistable](ArchiveWriter &writer) {
      persistable->save(writer);
    });
    ARCHIVE_DEBUG("Wrote component record " + recordName);
  }
}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

ArchiveResult RegionArchiveManager::load(Region &region) {
  if (m_mode != PersistenceMode::Inactive) {
    ARCHIVE_ERROR("Refusing to load " + describeRegion(region) +
                  " while persistence is " + getModeName(m_mode));
    return ArchiveResult::Failed;
  }

  const ArchiveStorage storage = getStorage();
  try {
    requirePrerequisites(region, storage, "load");
  } catch (const MissingPrerequisiteError &e) {
    ARCHIVE_ERROR(e.what());
    return ArchiveResult::Skipped;
  }
  if (!storage.regionArchiveExists(region.getId())) {
    return ArchiveResult::NothingToDo;
  }

  PersistenceModeGuard modeGuard(m_mode, PersistenceMode::Loading);
  RestorationGuard restorationGuard(region);
  LoadReport report;

  try {
    const std::string path = storage.getRegionArchivePath(region.getId());

    // Container is read and validated before the region is touched
    ArchiveLoadSession session(path, ARCHIVE_KIND);

    const EligibilityClassifier classifier = makeClassifier();
    report.wiped = wipe(region, classifier);

    ArchiveRecord record;
    if (!session.readRecord(
            ArchiveRecord::RECORD_NAME,
            [&record](ArchiveReader &reader) { record.load(reader); })) {
      throw ArchiveFormatError(path + " has no " +
                               ArchiveRecord::RECORD_NAME + " record");
    }
    report.componentsLoaded = loadComponents(region, session);

    applyTerrain(region, record);
    report.ghostsRemoved = removeGhosts(record.entities);

    session.preRegisterLiveTargets(m_world.getIdentities().snapshot());
    for (const auto &group : record.groupLeaders) {
      group->setManager(&region.getGroupManager());
    }

    session.closeReadingCursor();
    session.resolveAllCrossReferences();
    session.doAllPostLoadInits();

    report.containersDrained = drainStandingContainers(region, record.entities);
    report.restoredEntities = spawnArchived(region, record.entities);
    m_transfer.releaseCorpseInnerCreatures(record.entities);

    for (const auto &group : record.groupLeaders) {
      region.getGroupManager().add(group);
    }
    report.restoredGroups = record.groupLeaders.size();

    report.sideRegistry = m_transfer.restoreSideRegistry(region, m_rng);

    applyRoof(region, record);
    applyDecay(region, record, classifier, report);
    applySurfaceLayers(region, record);

    // A restored archive is spent; the next deactivation writes a fresh one
    if (!storage.removeRegionArchive(region.getId())) {
      ARCHIVE_WARN("Restored archive " + path + " could not be removed");
    }

    m_lastLoad = report;
    ARCHIVE_INFO("Restored " + describeRegion(region) + ": " +
                 std::to_string(report.restoredEntities) + " entities, " +
                 std::to_string(report.restoredGroups) + " groups, " +
                 std::to_string(report.wiped) + " wiped, " +
                 std::to_string(report.ghostsRemoved) + " ghosts removed, " +
                 std::to_string(report.elapsedTicks) + " ticks elapsed");
    return ArchiveResult::Restored;
  } catch (const IdentityCollisionError &e) {
    ARCHIVE_ERROR("Load of " + describeRegion(region) +
                  " aborted on identity collision: " + e.what());
  } catch (const PersistenceError &e) {
    ARCHIVE_ERROR("Load of " + describeRegion(region) +
                  " failed: " + e.what());
  } catch (const std::exception &e) {
    ARCHIVE_ERROR("Unexpected error loading " + describeRegion(region) +
                  ": " + e.what());
  }

  region.clearPendingCollapses();
  m_lastLoad = report;
  return ArchiveResult::Failed;
}

size_t RegionArchiveManager::wipe(Region &region,
                                  const EligibilityClassifier &classifier) {
  const std::vector<EntityPtr> snapshot = region.getEntities();
  size_t wiped = 0;

  for (const auto &entity : snapshot) {
    if (!classifier.shouldPersist(*entity)) {
      continue;
    }

    if (auto creature = std::dynamic_pointer_cast<Creature>(entity)) {
      for (const auto &group : region.getGroupManager().getGroups()) {
        group->removeOwned(*creature);
      }
      region.despawn(entity);
      m_world.forget(*entity);
    } else if (auto structure = std::dynamic_pointer_cast<Structure>(entity);
               structure && structure->isContainer()) {
      for (const auto &held : structure->drainContents()) {
        m_world.forget(*held);
      }
      region.vanish(entity);
    } else {
      region.vanish(entity);
    }
    ++wiped;
  }

  ARCHIVE_DEBUG("Wiped " + std::to_string(wiped) + " entities from " +
                describeRegion(region));
  return wiped;
}

size_t RegionArchiveManager::loadComponents(Region &region,
                                            ArchiveLoadSession &session) const {
  size_t loaded = 0;
  for (const auto &component : region.getComponents()) {
    auto persistable =
        std::dynamic_pointer_cast<IPersistableRegionComponent>(component);
    if (!persistable) {
      continue;
    }
    const std::string recordName =
        sanitizeComponentRecordName(persistable->getArchiveTag());
    const bool found =
        session.readRecord(recordName, [&persistable](ArchiveReader &reader) {
          persistable->load(reader);
        });
    if (found) {
      session.addTouchedObject(persistable);
      ++loaded;
    } else {
      ARCHIVE_DEBUG("No record " + recordName + "; component keeps defaults");
    }
  }
  return loaded;
}

void RegionArchiveManager::applyTerrain(Region &region,
                                        const ArchiveRecord &record) const {
  if (record.underTerrain) {
    GridCodec::deserializeU16(*record.underTerrain, region,
                              [&region](const CellPos &c, uint16_t id) {
                                region.setTerrain(c, id);
                              });
  }
  if (record.terrain) {
    GridCodec::deserializeU16(*record.terrain, region,
                              [&region](const CellPos &c, uint16_t id) {
                                region.setTerrain(c, id);
                              });
  }
}

size_t RegionArchiveManager::removeGhosts(
    const std::vector<EntityPtr> &archived) {
  std::unordered_set<EntityID> archivedCreatures;
  for (const auto &entity : archived) {
    collectCreatureIds(entity, archivedCreatures);
  }

  // Corpse inner creatures are the remembered dead, never ghosts
  for (const auto &inner :
       OwnershipTransferManager::corpseInnerCreatures(archived)) {
    archivedCreatures.erase(inner->getID());
  }

  WorldRegistry &registry = m_world.getRegistry();
  size_t removed = 0;
  for (EntityID id : archivedCreatures) {
    EntityPtr ghost = registry.findById(id);
    if (!ghost) {
      continue;
    }
    registry.remove(*ghost);
    registry.removeForcedRetention(id);
    m_world.forget(*ghost);
    ++removed;
    ARCHIVE_WARN("Removed world-level ghost " + ghost->getUniqueLoadId() +
                 " (" + ghost->getDefName() + ")");
  }
  return removed;
}

size_t RegionArchiveManager::drainStandingContainers(
    Region &region, const std::vector<EntityPtr> &archived) {
  size_t drained = 0;
  for (const auto &entity : archived) {
    if (!entity || entity->isDestroyed() || !region.inBounds(entity->getPosition())) {
      continue;
    }
    StructurePtr standing = region.getContainerAt(entity->getPosition());
    if (!standing || standing->getContents().empty()) {
      continue;
    }
    for (const auto &held : standing->drainContents()) {
      auto creature = std::dynamic_pointer_cast<Creature>(held);
      if (creature && creature->isHumanlike() && !creature->isDestroyed()) {
        m_world.getRegistry().passToWorld(creature, RetentionPolicy::Discard);
      } else {
        m_world.forget(*held);
      }
    }
    ++drained;
  }
  return drained;
}

size_t RegionArchiveManager::spawnArchived(
    Region &region, const std::vector<EntityPtr> &archived) {
  size_t spawned = 0;
  for (const auto &entity : archived) {
    if (!entity || entity->isDestroyed()) {
      continue;
    }
    const CellPos cell = entity->getPosition();
    if (!region.inBounds(cell)) {
      ARCHIVE_WARN("Archived " + entity->getUniqueLoadId() +
                   " lies outside " + describeRegion(region) + "; dropped");
      continue;
    }
    region.spawn(entity, cell, entity->getRotation());
    ++spawned;
  }
  return spawned;
}

void RegionArchiveManager::applyRoof(Region &region,
                                     const ArchiveRecord &record) const {
  if (record.roof) {
    GridCodec::deserializeU16(*record.roof, region,
                              [&region](const CellPos &c, uint16_t id) {
                                region.setRoof(c, id);
                              });
  }
  region.recomputeStructuralSupport();
  region.clearPendingCollapses();
}

void RegionArchiveManager::applyDecay(Region &region,
                                      const ArchiveRecord &record,
                                      const EligibilityClassifier &classifier,
                                      LoadReport &report) {
  const int64_t now = m_world.getClock().getTicksGame();
  const DecayContext context =
      DecayContext::build(region, record.abandonedAtTick, now, m_climate,
                          m_config.decay.rainfallReference);
  report.elapsedTicks = context.elapsedTicks;

  if (!m_config.decay.enabled) {
    DECAY_DEBUG("Decay disabled; " + describeRegion(region) +
                " restored as saved");
    return;
  }

  report.decay = m_decay.applyToRegion(region, context, classifier);
  report.floorsEroded = m_decay.applyFloorErosion(region, context, m_rng);
  report.failures = m_decay.simulateStructuralFailures(region, context, m_rng);

  DECAY_INFO(describeRegion(region) + " aged " +
             std::to_string(context.days()) + " days: " +
             std::to_string(report.decay.rotted) + " rotted, " +
             std::to_string(report.decay.weathered) + " weathered, " +
             std::to_string(report.decay.structuresDamaged) +
             " structures damaged, " + std::to_string(report.decay.destroyed) +
             " destroyed, " + std::to_string(report.floorsEroded) +
             " floors eroded, " + std::to_string(report.failures.events) +
             " failure events");
}

void RegionArchiveManager::applySurfaceLayers(
    Region &region, const ArchiveRecord &record) const {
  if (record.snow) {
    GridCodec::deserializeU8(*record.snow, region,
                             [&region](const CellPos &c, uint8_t depth) {
                               region.setSnowDepth(c, depth);
                             });
  }

  if (record.pollution) {
    if (region.hasPollutionFeature()) {
      GridCodec::deserializeU8(*record.pollution, region,
                               [&region](const CellPos &c, uint8_t flag) {
                                 region.setPolluted(c, flag != 0);
                               });
    } else {
      ARCHIVE_DEBUG("Pollution layer ignored; " + describeRegion(region) +
                    " has no pollution feature");
    }
  }

  if (record.fog) {
    region.refogAll();
    GridCodec::deserializeU8(*record.fog, region,
                             [&region](const CellPos &c, uint8_t flag) {
                               if (flag == 0) {
                                 region.unfog(c);
                               }
                             });
  }
}

} // namespace Strata
