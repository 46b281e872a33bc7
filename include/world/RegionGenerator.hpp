/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGION_GENERATOR_HPP
#define REGION_GENERATOR_HPP

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "world/RegionTypes.hpp"

namespace Strata {

class Region;
class World;

struct RegionGenerationConfig {
    int width{64};
    int height{64};
    int seed{42};
    float elevationFrequency{0.06f};
    float humidityFrequency{0.09f};
    float waterLevel{0.22f};
    float rockLevel{0.80f};     // elevation from which the cell is solid rock under a thick rock roof
    int buildingCount{2};
    int wildlifeCount{6};
    int plantCount{24};
    int looseItemCount{8};
    int revealRadius{10};       // area around the center left unfogged
    bool pollutionFeature{false};
};

// Progress callback type: void callback(float percentComplete, const std::string& statusMessage)
using RegionGenerationProgressCallback = std::function<void(float, const std::string&)>;

/**
 * @brief Builds the fresh state of a region: noise terrain, rock outcrops,
 * small roofed buildings with beds and shelves, plants, wildlife and loose
 * items. The same seed always produces the same region.
 */
class RegionGenerator {
private:
    struct PerlinNoise {
        std::vector<int> permutation;

        explicit PerlinNoise(int seed);
        float noise(float x, float y) const;
        float fade(float t) const;
        float lerp(float t, float a, float b) const;
        float grad(int hash, float x, float y) const;
    };

    static void generateNoiseMaps(
        const RegionGenerationConfig& config,
        std::vector<std::vector<float>>& elevationMap,
        std::vector<std::vector<float>>& humidityMap
    );

    static void assignTerrain(
        Region& region,
        const std::vector<std::vector<float>>& elevationMap,
        const std::vector<std::vector<float>>& humidityMap,
        const RegionGenerationConfig& config
    );

    static void raiseRockOutcrops(
        Region& region,
        const std::vector<std::vector<float>>& elevationMap,
        const RegionGenerationConfig& config
    );

    static int generateBuildings(
        Region& region,
        const RegionGenerationConfig& config,
        std::default_random_engine& rng
    );

    static bool canPlaceBuilding(
        const Region& region,
        int x, int z, int size
    );

    static void createBuilding(
        Region& region,
        int x, int z, int size,
        std::default_random_engine& rng
    );

    static void distributePlants(Region& region, const RegionGenerationConfig& config, std::default_random_engine& rng);
    static void distributeWildlife(Region& region, const RegionGenerationConfig& config, std::default_random_engine& rng);
    static void distributeLooseItems(Region& region, const RegionGenerationConfig& config, std::default_random_engine& rng);
    static void applyInitialFog(Region& region, const RegionGenerationConfig& config);

public:
    static std::unique_ptr<Region> generateRegion(
        RegionId regionId,
        TileId tileId,
        World& world,
        const RegionGenerationConfig& config,
        const RegionGenerationProgressCallback& progressCallback = nullptr
    );

    // Fills an existing, empty region
    static void populate(
        Region& region,
        const RegionGenerationConfig& config,
        const RegionGenerationProgressCallback& progressCallback = nullptr
    );
};

}

#endif
