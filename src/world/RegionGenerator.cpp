/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/RegionGenerator.hpp"
#include "core/Logger.hpp"
#include "core/SimulationClock.hpp"
#include "entities/Creature.hpp"
#include "entities/Item.hpp"
#include "entities/Structure.hpp"
#include "world/Region.hpp"
#include "world/TerrainCatalog.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <optional>

namespace Strata {

namespace {

constexpr int MAX_PLACEMENT_ATTEMPTS = 200;

std::optional<CellPos> pickOpenCell(const Region &region,
                                    std::default_random_engine &rng) {
  std::uniform_int_distribution<int> xDist(0, region.getWidth() - 1);
  std::uniform_int_distribution<int> zDist(0, region.getHeight() - 1);
  for (int attempt = 0; attempt < MAX_PLACEMENT_ATTEMPTS; ++attempt) {
    const CellPos cell{xDist(rng), zDist(rng)};
    if (region.isStandable(cell) && !region.isRoofed(cell)) {
      return cell;
    }
  }
  return std::nullopt;
}

StructurePtr makeWall(StructureMaterial material) {
  auto wall = std::make_shared<Structure>(
      material == StructureMaterial::Stone ? "granite_block_wall" : "wood_wall",
      material);
  wall->setMaxHitPoints(material == StructureMaterial::Stone ? 450 : 300);
  wall->setHitPoints(wall->getMaxHitPoints());
  return wall;
}

ItemPtr makeItem(const std::string &defName, int stack, float rotThreshold) {
  auto item = std::make_shared<Item>(defName, stack);
  item->setRotThreshold(rotThreshold);
  return item;
}

} // namespace

RegionGenerator::PerlinNoise::PerlinNoise(int seed) {
  permutation.resize(256);
  std::iota(permutation.begin(), permutation.end(), 0);

  std::default_random_engine engine(seed);
  std::shuffle(permutation.begin(), permutation.end(), engine);

  auto copy = permutation;
  permutation.insert(permutation.end(), copy.begin(), copy.end());
}

float RegionGenerator::PerlinNoise::fade(float t) const {
  return t * t * t * (t * (t * 6 - 15) + 10);
}

float RegionGenerator::PerlinNoise::lerp(float t, float a, float b) const {
  return a + t * (b - a);
}

float RegionGenerator::PerlinNoise::grad(int hash, float x, float y) const {
  int h = hash & 15;
  float u = h < 8 ? x : y;
  float v = h < 4 ? y : h == 12 || h == 14 ? x : 0;
  return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

float RegionGenerator::PerlinNoise::noise(float x, float y) const {
  int X = static_cast<int>(std::floor(x)) & 255;
  int Y = static_cast<int>(std::floor(y)) & 255;

  x -= std::floor(x);
  y -= std::floor(y);

  float u = fade(x);
  float v = fade(y);

  int A = permutation[X] + Y;
  int AA = permutation[A];
  int AB = permutation[A + 1];
  int B = permutation[X + 1] + Y;
  int BA = permutation[B];
  int BB = permutation[B + 1];

  return lerp(
      v, lerp(u, grad(permutation[AA], x, y), grad(permutation[BA], x - 1, y)),
      lerp(u, grad(permutation[AB], x, y - 1),
           grad(permutation[BB], x - 1, y - 1)));
}

std::unique_ptr<Region>
RegionGenerator::generateRegion(RegionId regionId, TileId tileId, World &world,
                                const RegionGenerationConfig &config,
                                const RegionGenerationProgressCallback &progressCallback) {
  auto region = std::make_unique<Region>(regionId, tileId, config.width,
                                         config.height, world);
  populate(*region, config, progressCallback);
  return region;
}

void RegionGenerator::populate(Region &region,
                               const RegionGenerationConfig &config,
                               const RegionGenerationProgressCallback &progressCallback) {
  GENERATOR_INFO("Generating region " + std::to_string(region.getId()) + ": " +
                 std::to_string(region.getWidth()) + "x" +
                 std::to_string(region.getHeight()) + " with seed " +
                 std::to_string(config.seed));

  if (progressCallback) {
    progressCallback(0.0f, "Initializing region generation...");
  }

  region.enablePollutionFeature(config.pollutionFeature);

  std::vector<std::vector<float>> elevationMap, humidityMap;
  RegionGenerationConfig sized = config;
  sized.width = region.getWidth();
  sized.height = region.getHeight();
  generateNoiseMaps(sized, elevationMap, humidityMap);

  assignTerrain(region, elevationMap, humidityMap, sized);
  raiseRockOutcrops(region, elevationMap, sized);

  if (progressCallback) {
    progressCallback(40.0f, "Raising buildings...");
  }

  std::default_random_engine rng(static_cast<unsigned>(config.seed));
  const int buildings = generateBuildings(region, sized, rng);

  if (progressCallback) {
    progressCallback(70.0f, "Populating region...");
  }

  distributePlants(region, sized, rng);
  distributeWildlife(region, sized, rng);
  distributeLooseItems(region, sized, rng);

  region.recomputeStructuralSupport();
  applyInitialFog(region, sized);

  if (progressCallback) {
    progressCallback(100.0f, "Finalizing region...");
  }

  GENERATOR_INFO("Region " + std::to_string(region.getId()) + " generated: " +
                 std::to_string(buildings) + " buildings, " +
                 std::to_string(region.getEntityCount()) + " entities");
}

void RegionGenerator::generateNoiseMaps(
    const RegionGenerationConfig &config,
    std::vector<std::vector<float>> &elevationMap,
    std::vector<std::vector<float>> &humidityMap) {
  elevationMap.assign(config.height, std::vector<float>(config.width));
  humidityMap.assign(config.height, std::vector<float>(config.width));

  PerlinNoise elevationNoise(config.seed);
  PerlinNoise humidityNoise(config.seed + 1000);

  for (int z = 0; z < config.height; ++z) {
    for (int x = 0; x < config.width; ++x) {
      float elevation = elevationNoise.noise(x * config.elevationFrequency,
                                             z * config.elevationFrequency);
      elevation = (elevation + 1.0f) * 0.5f; // Normalize to [0, 1]

      float humidity = humidityNoise.noise(x * config.humidityFrequency,
                                           z * config.humidityFrequency);
      humidity = (humidity + 1.0f) * 0.5f; // Normalize to [0, 1]

      elevationMap[z][x] = elevation;
      humidityMap[z][x] = humidity;
    }
  }
}

void RegionGenerator::assignTerrain(
    Region &region, const std::vector<std::vector<float>> &elevationMap,
    const std::vector<std::vector<float>> &humidityMap,
    const RegionGenerationConfig &config) {
  for (int z = 0; z < config.height; ++z) {
    for (int x = 0; x < config.width; ++x) {
      const float elevation = elevationMap[z][x];
      const float humidity = humidityMap[z][x];

      uint16_t terrain = TerrainIds::SOIL;
      if (elevation < config.waterLevel) {
        terrain = TerrainIds::DEEP_WATER;
      } else if (elevation >= config.rockLevel) {
        terrain = TerrainIds::GRAVEL;
      } else if (humidity > 0.7f && elevation < 0.4f) {
        terrain = TerrainIds::MARSH;
      } else if (humidity < 0.3f) {
        terrain = TerrainIds::GRAVEL;
      }
      region.setTerrain(CellPos{x, z}, terrain);
    }
  }
}

void RegionGenerator::raiseRockOutcrops(
    Region &region, const std::vector<std::vector<float>> &elevationMap,
    const RegionGenerationConfig &config) {
  for (int z = 0; z < config.height; ++z) {
    for (int x = 0; x < config.width; ++x) {
      if (elevationMap[z][x] < config.rockLevel) {
        continue;
      }
      const CellPos cell{x, z};
      auto rock = std::make_shared<Structure>("granite", StructureMaterial::Stone);
      rock->setNaturalRock(true);
      rock->setMaxHitPoints(1500);
      rock->setHitPoints(1500);
      region.spawn(rock, cell);
      region.setRoof(cell, RoofIds::THICK_ROCK);
    }
  }
}

int RegionGenerator::generateBuildings(Region &region,
                                       const RegionGenerationConfig &config,
                                       std::default_random_engine &rng) {
  std::uniform_int_distribution<int> sizeDist(5, 7);
  int built = 0;

  for (int attempt = 0; attempt < MAX_PLACEMENT_ATTEMPTS && built < config.buildingCount; ++attempt) {
    const int size = sizeDist(rng);
    if (config.width <= size || config.height <= size) {
      break;
    }
    std::uniform_int_distribution<int> xDist(0, config.width - size);
    std::uniform_int_distribution<int> zDist(0, config.height - size);
    const int x = xDist(rng);
    const int z = zDist(rng);

    if (!canPlaceBuilding(region, x, z, size)) {
      continue;
    }
    createBuilding(region, x, z, size, rng);
    ++built;
  }

  if (built < config.buildingCount) {
    GENERATOR_WARN("Placed " + std::to_string(built) + " of " +
                   std::to_string(config.buildingCount) + " buildings");
  }
  return built;
}

bool RegionGenerator::canPlaceBuilding(const Region &region, int x, int z, int size) {
  // One cell of clearance around the footprint
  for (int dz = -1; dz <= size; ++dz) {
    for (int dx = -1; dx <= size; ++dx) {
      const CellPos cell{x + dx, z + dz};
      if (!region.inBounds(cell)) {
        if (dx >= 0 && dx < size && dz >= 0 && dz < size) {
          return false;
        }
        continue;
      }
      if (!region.isStandable(cell) || region.isRoofed(cell) ||
          region.getTerrain(cell) == TerrainIds::MARSH ||
          region.hasConstructedFloor(cell)) {
        return false;
      }
    }
  }
  return true;
}

void RegionGenerator::createBuilding(Region &region, int x, int z, int size,
                                     std::default_random_engine &rng) {
  std::uniform_real_distribution<float> dist(0.0f, 1.0f);
  const StructureMaterial material =
      dist(rng) < 0.6f ? StructureMaterial::Wood : StructureMaterial::Stone;
  const CellPos doorway{x + size / 2, z + size - 1};

  for (int dz = 0; dz < size; ++dz) {
    for (int dx = 0; dx < size; ++dx) {
      const CellPos cell{x + dx, z + dz};
      const bool perimeter = dx == 0 || dz == 0 || dx == size - 1 || dz == size - 1;
      if (perimeter && cell != doorway) {
        region.spawn(makeWall(material), cell);
        continue;
      }
      region.setTerrain(cell, TerrainIds::WOOD_FLOOR);
      region.setRoof(cell, RoofIds::CONSTRUCTED);
    }
  }

  // Furniture sits in the first interior row
  auto bed = std::make_shared<Structure>("bed", StructureMaterial::Wood);
  bed->makeContainer(1);
  bed->setMaxHitPoints(140);
  bed->setHitPoints(140);
  region.spawn(bed, CellPos{x + 1, z + 1});

  auto shelf = std::make_shared<Structure>("shelf", StructureMaterial::Wood);
  shelf->makeContainer(3);
  shelf->setMaxHitPoints(100);
  shelf->setHitPoints(100);
  shelf->setPosition(CellPos{x + size - 2, z + 1});
  for (const auto &stock : {makeItem("packaged_meal", 6, 0.0f),
                             makeItem("raw_meat", 20, 2.0f * static_cast<float>(TICKS_PER_DAY))}) {
    if (!shelf->tryAccept(stock)) {
      GENERATOR_WARN("Shelf rejected " + stock->getDefName());
    }
  }
  region.spawn(shelf, shelf->getPosition());
}

void RegionGenerator::distributePlants(Region &region,
                                       const RegionGenerationConfig &config,
                                       std::default_random_engine &rng) {
  static const std::array<const char *, 3> plantDefs{"oak_tree", "berry_bush", "tall_grass"};
  std::uniform_int_distribution<size_t> defDist(0, plantDefs.size() - 1);

  for (int i = 0; i < config.plantCount; ++i) {
    auto cell = pickOpenCell(region, rng);
    if (!cell || region.getTerrain(*cell) == TerrainIds::DEEP_WATER) {
      continue;
    }
    auto plant = std::make_shared<Entity>(EntityCategory::Plant, plantDefs[defDist(rng)]);
    plant->setMaxHitPoints(60);
    plant->setHitPoints(60);
    region.spawn(plant, *cell);
  }
}

void RegionGenerator::distributeWildlife(Region &region,
                                         const RegionGenerationConfig &config,
                                         std::default_random_engine &rng) {
  static const std::array<const char *, 3> animalDefs{"muffalo", "deer", "boar"};
  std::uniform_int_distribution<size_t> defDist(0, animalDefs.size() - 1);

  for (int i = 0; i < config.wildlifeCount; ++i) {
    auto cell = pickOpenCell(region, rng);
    if (!cell) {
      GENERATOR_WARN("No open cell left for wildlife");
      return;
    }
    region.spawn(std::make_shared<Creature>(animalDefs[defDist(rng)], false), *cell);
  }
}

void RegionGenerator::distributeLooseItems(Region &region,
                                           const RegionGenerationConfig &config,
                                           std::default_random_engine &rng) {
  for (int i = 0; i < config.looseItemCount; ++i) {
    auto cell = pickOpenCell(region, rng);
    if (!cell) {
      return;
    }
    ItemPtr item;
    switch (i % 3) {
    case 0:
      item = makeItem("steel", 25, 0.0f);
      break;
    case 1:
      item = makeItem("wood_log", 40, 0.0f);
      break;
    default:
      item = makeItem("raw_corn", 30, 3.0f * static_cast<float>(TICKS_PER_DAY));
      break;
    }
    region.spawn(item, *cell);
  }
}

void RegionGenerator::applyInitialFog(Region &region,
                                      const RegionGenerationConfig &config) {
  region.refogAll();
  const CellPos center{region.getWidth() / 2, region.getHeight() / 2};
  for (int z = 0; z < region.getHeight(); ++z) {
    for (int x = 0; x < region.getWidth(); ++x) {
      const CellPos cell{x, z};
      if (cell.chebyshevDistance(center) <= config.revealRadius) {
        region.unfog(cell);
      }
    }
  }
}

} // namespace Strata
