/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECAY_SIMULATION_HPP
#define DECAY_SIMULATION_HPP

#include "decay/DecayContext.hpp"
#include "entities/Entity.hpp"
#include "entities/Item.hpp"
#include "entities/Structure.hpp"
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace Strata {

class EligibilityClassifier;
class Region;

/**
 * @brief Closed-form aging of a restored region.
 *
 * Nothing here replays the simulation. Every rule is a function of the
 * DecayContext and one entity or cell; the only randomness is drawn from the
 * generator passed in, so a fixed seed reproduces a restore exactly.
 */
class DecaySimulation {
public:
    static constexpr int64_t ROT_STEP_TICKS = TICKS_PER_HOUR;
    static constexpr int64_t DETERIORATION_INTERVAL_TICKS = 250;
    static constexpr float OUTDOOR_DAMAGE_PER_INTERVAL = 0.015f;
    static constexpr double FAILURE_MIN_YEARS = 0.25;
    static constexpr float FLOOR_EROSION_RATE = 0.06f;

    struct RotOutcome {
        float rotProgress{0.0f};
        bool rotted{false};
        int64_t completionTick{-1}; // absolute tick the threshold was reached
    };

    struct DecayReport {
        size_t rotted{0};
        size_t weathered{0};
        size_t structuresDamaged{0};
        size_t destroyed{0};
    };

    struct FailureReport {
        int events{0};
        size_t structuresDamaged{0};
        size_t structuresDestroyed{0};
        size_t floorsRemoved{0};
    };

    DecaySimulation(const IClimateSampler& climate, DecayTuning tuning)
        : m_climate(climate), m_tuning(tuning) {}

    const DecayTuning& getTuning() const { return m_tuning; }

    // ------------------------------------------------------------------
    // Rules
    // ------------------------------------------------------------------

    RotOutcome simulateRot(const DecayContext& context, float rotProgress, float threshold) const;

    // Hit points an unroofed item, corpse or plant loses over the interval
    int outdoorDeterioration(const DecayContext& context) const;

    static float materialFactor(StructureMaterial material);
    float structuralDecayFraction(const DecayContext& context, StructureMaterial material, bool roofed) const;
    int structuralDamage(const DecayContext& context, const Structure& structure, bool roofed) const;

    double floorErosionProbability(const DecayContext& context) const;

    // Share of the candidate structures standing under a roof; 0 for none
    static float candidateRoofCoverage(const Region& region, const std::vector<StructurePtr>& candidates);

    double expectedFailureEvents(const DecayContext& context, float roofCoverage) const;
    // Never more than FAILURE_EVENT_CAP, even if the tuning allows more
    int sampleFailureEventCount(const DecayContext& context, float roofCoverage, std::mt19937& rng) const;

    static double failureSeverity(double years);
    static double failureFalloff(double distance, int radius);

    // ------------------------------------------------------------------
    // Region passes
    // ------------------------------------------------------------------

    /**
     * @brief Ages one placed entity. Destroys it through its region when a
     * rule says it is gone.
     * @return true if the entity was destroyed
     */
    bool applyDecay(const EntityPtr& entity, const DecayContext& context, DecayReport& report) const;

    DecayReport applyToRegion(Region& region, const DecayContext& context,
                              const EligibilityClassifier& classifier) const;

    size_t applyFloorErosion(Region& region, const DecayContext& context, std::mt19937& rng) const;

    FailureReport simulateStructuralFailures(Region& region, const DecayContext& context, std::mt19937& rng) const;

private:
    bool applyRot(Item& item, const DecayContext& context) const;
    void applyFailureEvent(Region& region, const DecayContext& context, std::vector<StructurePtr>& candidates,
                           std::mt19937& rng, FailureReport& report) const;

    const IClimateSampler& m_climate;
    DecayTuning m_tuning;
};

} // namespace Strata

#endif // DECAY_SIMULATION_HPP
