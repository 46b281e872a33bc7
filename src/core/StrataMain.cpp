/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/DeferredTaskQueue.hpp"
#include "core/Logger.hpp"
#include "core/RegionLifecycleHooks.hpp"
#include "managers/PersistenceSettings.hpp"
#include "managers/RegionArchiveManager.hpp"
#include "managers/WorldSessionManager.hpp"
#include "persistence/PersistenceConfig.hpp"
#include "world/ClimateModel.hpp"
#include "world/Region.hpp"
#include "world/RegionChronicle.hpp"
#include "world/RegionGenerator.hpp"
#include "world/World.hpp"
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

namespace {

const Strata::RegionId DEMO_REGION_ID{1};
const Strata::TileId DEMO_TILE_ID{7};
const std::string SETTINGS_PATH{"res/persistence.json"};

void printRegionSummary(const std::string& heading, const Strata::Region& region) {
  std::map<std::string, size_t> byCategory;
  size_t contained = 0;
  for (const auto& entity : region.getEntities()) {
    ++byCategory[Strata::getCategoryName(entity->getCategory())];
    if (auto structure = std::dynamic_pointer_cast<Strata::Structure>(entity)) {
      contained += structure->getContents().size();
    }
  }

  std::cout << "== " << heading << " ==\n";
  std::cout << "  entities: " << region.getEntityCount() << " (" << contained << " held in containers)\n";
  for (const auto& [category, count] : byCategory) {
    std::cout << "    " << category << ": " << count << "\n";
  }
  std::cout << "  groups: " << region.getGroupManager().getGroups().size()
            << ", roof coverage: " << region.getRoofCoverage() << "\n";
  if (auto chronicle = region.findComponent<Strata::RegionChronicle>()) {
    std::cout << "  abandoned " << chronicle->getAbandonCount() << " time(s), last restored at tick "
              << chronicle->getLastRestoredTick() << "\n";
  }
}

void settleColony(Strata::World& world, Strata::Region& region) {
  const Strata::FactionPtr colony = world.getFactions().getPlayerFaction();
  const Strata::FactionPtr machines = world.createFaction("Mechanoid Hive");

  for (const auto& container : region.getContainers()) {
    if (container->getDefName() != "bed" || !container->getContents().empty()) {
      continue;
    }
    auto sleeper = std::make_shared<Strata::Creature>("colonist", true);
    sleeper->setFaction(colony);
    if (container->tryAccept(sleeper)) {
      world.adopt(sleeper);
    }
    break;
  }

  const Strata::CellPos center{region.getWidth() / 2, region.getHeight() / 2};
  if (auto cell = region.findStandableNear(center, 12)) {
    auto husky = std::make_shared<Strata::Creature>("husky", false);
    husky->setFaction(colony);
    region.spawn(husky, *cell);
  }

  auto cluster = std::make_shared<Strata::GroupController>("dormant cluster", machines);
  for (int i = 0; i < 3; ++i) {
    auto cell = region.findStandableNear(Strata::CellPos{4 + i * 2, 4}, 10);
    if (!cell) {
      continue;
    }
    auto mech = std::make_shared<Strata::Creature>("mech_scyther", false);
    mech->setFaction(machines);
    region.spawn(mech, *cell);
    cluster->addOwned(mech);
  }
  region.getGroupManager().add(cluster);
}

std::unique_ptr<Strata::Region> buildRegion(Strata::World& world, const Strata::RegionGenerationConfig& config) {
  auto region = Strata::RegionGenerator::generateRegion(DEMO_REGION_ID, DEMO_TILE_ID, world, config);
  auto chronicle = std::make_shared<Strata::RegionChronicle>(*region);
  chronicle->setFoundingFaction(world.getFactions().getPlayerFaction());
  region->addComponent(chronicle);
  return region;
}

} // namespace

// Usage: strata_region_demo [days-absent] [settings.json]
int main(int argc, char* argv[]) {
  const double daysAbsent = argc > 1 ? std::atof(argv[1]) : 120.0;
  const std::string settingsPath = argc > 2 ? argv[2] : SETTINGS_PATH;

  auto& settings = Strata::PersistenceSettings::Instance();
  if (!settings.loadFromFile(settingsPath)) {
    STRATA_WARN("Demo", "Failed to load " + settingsPath + " - using defaults");
  }
  Strata::PersistenceConfig config = Strata::PersistenceConfig::fromSettings(settings);

  Strata::World world;
  world.setPersistentId(config.persistentId.empty() ? "demo_colony" : config.persistentId);
  world.createFaction("Colony", true);

  Strata::SeasonalClimateModel climate;
  climate.setTileClimate(DEMO_TILE_ID, Strata::TileClimate{8.0f, 16.0f, 6.0f, 2200.0f});

  Strata::RegionArchiveManager archives(world, climate, config);
  Strata::DeferredTaskQueue deferred;
  Strata::RegionLifecycleHooks hooks(archives, deferred);
  Strata::WorldSessionManager session(world);

  const Strata::ArchiveStorage storage = archives.getStorage();
  if (!storage.isConfigured()) {
    STRATA_CRITICAL("Demo", "No archive storage location available");
    return EXIT_FAILURE;
  }

  Strata::RegionGenerationConfig generation;
  generation.seed = 1337;

  auto region = buildRegion(world, generation);
  settleColony(world, *region);
  printRegionSummary("Before abandoning", *region);

  const Strata::ArchiveResult saved = hooks.onRegionDeactivated(*region, DEMO_REGION_ID);
  if (saved != Strata::ArchiveResult::Saved) {
    STRATA_CRITICAL("Demo", std::string("Region save failed: ") + Strata::getArchiveResultName(saved));
    return EXIT_FAILURE;
  }
  const Strata::SaveStatistics& stats = archives.getLastSaveStatistics();
  std::cout << "Archive written: " << Strata::SaveStatistics::formatBytes(stats.archiveBytes) << " on disk, "
            << Strata::SaveStatistics::formatBytes(stats.memoryBytes()) << " kept in memory\n";
  region.reset();

  world.getClock().advanceDays(daysAbsent);
  world.collectGarbage({});

  // Round trip the world state as a full host save and reload would
  if (!session.save(storage) || !session.load(storage)) {
    STRATA_CRITICAL("Demo", "World session round trip failed");
    return EXIT_FAILURE;
  }

  region = buildRegion(world, generation);
  printRegionSummary("Freshly generated", *region);

  deferred.beginBatch();
  const auto immediate = hooks.onRegionActivated(*region, DEMO_REGION_ID);
  deferred.endBatch();
  const auto restored = immediate ? immediate : hooks.getLastDeferredResult();

  if (!restored || *restored != Strata::ArchiveResult::Restored) {
    STRATA_CRITICAL("Demo", std::string("Region restore failed: ") +
                                (restored ? Strata::getArchiveResultName(*restored) : "not run"));
    return EXIT_FAILURE;
  }

  const auto& report = archives.getLastLoadReport();
  printRegionSummary("Restored after " + std::to_string(daysAbsent) + " days", *region);
  std::cout << "Decay: " << report.decay.rotted << " rotted, " << report.decay.weathered << " weathered, "
            << report.decay.structuresDamaged << " structures damaged, " << report.decay.destroyed
            << " destroyed, " << report.floorsEroded << " floors eroded, " << report.failures.events
            << " failure events\n";
  std::cout << "Side registry: " << report.sideRegistry.reinsertedOccupants << " occupants re-inserted, "
            << report.sideRegistry.ownedAnimals << " animals returned, " << report.sideRegistry.freePlaced
            << " placed nearby\n";
  return EXIT_SUCCESS;
}
