/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decay/DecaySimulation.hpp"
#include "core/Logger.hpp"
#include "persistence/EligibilityClassifier.hpp"
#include "world/Region.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace Strata {

namespace {

constexpr float ROOFED_EXPOSURE = 0.08f;
constexpr float FREEZE_THAW_FACTOR = 1.4f;
constexpr float FLOOR_FREEZE_FACTOR = 1.5f;
constexpr double FAILURE_FREEZE_SCALE = 1.3;
constexpr double FAILURE_SEVERITY_YEARS = 5.0;
constexpr double FAILURE_FALLOFF_EXPONENT = 1.8;
constexpr double ROOFED_EPICENTER_MULT = 0.65;
constexpr double ROOFED_TARGET_MULT = 0.35;
constexpr int FAILURE_MIN_RADIUS = 2;
constexpr int FAILURE_MAX_RADIUS = 6;
constexpr double UNROOFED_EPICENTER_WEIGHT = 3.0;
constexpr double ROOFED_EPICENTER_WEIGHT = 1.0;

// Shared by outdoor weathering, unroofed structures and floor erosion
float rainFactor(const DecayContext& context)
{
    return 0.5f + 1.5f * context.normalizedRain;
}

bool isWeatherable(EntityCategory category)
{
    return category == EntityCategory::Item || category == EntityCategory::Corpse ||
           category == EntityCategory::Plant;
}

bool isFailureCandidate(const StructurePtr& structure)
{
    return structure && !structure->isDestroyed() && structure->isSpawned() && !structure->isNaturalRock() &&
           !structure->isUnderConstruction();
}

} // namespace

// ----------------------------------------------------------------------------
// Rules
// ----------------------------------------------------------------------------

DecaySimulation::RotOutcome DecaySimulation::simulateRot(const DecayContext& context, float rotProgress,
                                                         float threshold) const
{
    RotOutcome outcome;
    outcome.rotProgress = rotProgress;
    if (threshold <= 0.0f) {
        return outcome;
    }
    if (rotProgress >= threshold) {
        outcome.rotted = true;
        outcome.completionTick = context.startTick;
        return outcome;
    }

    const int64_t endTick = context.startTick + context.elapsedTicks;
    double rot = rotProgress;
    for (int64_t tick = context.startTick; tick < endTick; tick += ROT_STEP_TICKS) {
        const int64_t step = std::min(ROT_STEP_TICKS, endTick - tick);
        const float temperature =
            m_climate.seasonalTemperature(tick, context.tileId) + m_climate.diurnalOffset(tick, context.tileId);
        const double rate = m_climate.rotRateAtTemperature(temperature);
        const double next = rot + rate * static_cast<double>(step);

        if (next >= threshold) {
            const int64_t into = static_cast<int64_t>(std::ceil((threshold - rot) / rate));
            outcome.rotted = true;
            outcome.completionTick = tick + std::min(into, step);
            outcome.rotProgress = static_cast<float>(next);
            return outcome;
        }
        rot = next;
    }

    outcome.rotProgress = static_cast<float>(rot);
    return outcome;
}

int DecaySimulation::outdoorDeterioration(const DecayContext& context) const
{
    const double intervals =
        static_cast<double>(context.elapsedTicks) / static_cast<double>(DETERIORATION_INTERVAL_TICKS);
    return static_cast<int>(std::lround(intervals * OUTDOOR_DAMAGE_PER_INTERVAL * rainFactor(context)));
}

float DecaySimulation::materialFactor(StructureMaterial material)
{
    switch (material) {
        case StructureMaterial::Wood: return 0.15f;
        case StructureMaterial::Metal: return 0.07f;
        case StructureMaterial::Stone: return 0.02f;
        case StructureMaterial::Abstract: return 0.04f;
        case StructureMaterial::Unknown: return 0.05f;
    }
    return 0.05f;
}

float DecaySimulation::structuralDecayFraction(const DecayContext& context, StructureMaterial material,
                                               bool roofed) const
{
    const float exposure = roofed ? ROOFED_EXPOSURE : 1.0f;
    const float rain = roofed ? 1.0f : rainFactor(context);
    const float freeze = context.freezeThaw ? FREEZE_THAW_FACTOR : 1.0f;
    return static_cast<float>(context.years()) * materialFactor(material) * exposure * rain * freeze;
}

int DecaySimulation::structuralDamage(const DecayContext& context, const Structure& structure, bool roofed) const
{
    const float fraction = structuralDecayFraction(context, structure.getMaterial(), roofed);
    return static_cast<int>(std::lround(static_cast<double>(structure.getMaxHitPoints()) * fraction));
}

double DecaySimulation::floorErosionProbability(const DecayContext& context) const
{
    const double freezeMod = context.freezeThaw ? FLOOR_FREEZE_FACTOR : 1.0;
    const double yearly = std::min(1.0, FLOOR_EROSION_RATE * rainFactor(context) * freezeMod);
    return 1.0 - std::pow(1.0 - yearly, context.years());
}

float DecaySimulation::candidateRoofCoverage(const Region& region, const std::vector<StructurePtr>& candidates)
{
    if (candidates.empty()) {
        return 0.0f;
    }
    const auto roofed = std::count_if(candidates.begin(), candidates.end(), [&region](const StructurePtr& s) {
        return region.isRoofed(s->getPosition());
    });
    return static_cast<float>(roofed) / static_cast<float>(candidates.size());
}

double DecaySimulation::expectedFailureEvents(const DecayContext& context, float roofCoverage) const
{
    if (context.years() < FAILURE_MIN_YEARS || m_tuning.failureMtbDays <= 0.0f) {
        return 0.0;
    }
    const double rainScale = 1.0 + context.normalizedRain;
    const double freezeScale = context.freezeThaw ? FAILURE_FREEZE_SCALE : 1.0;
    const double exposureScale = 1.0 + (1.0 - std::clamp(roofCoverage, 0.0f, 1.0f));
    const double mtbDays = m_tuning.failureMtbDays / (rainScale * freezeScale * exposureScale);
    return context.days() / mtbDays;
}

int DecaySimulation::sampleFailureEventCount(const DecayContext& context, float roofCoverage,
                                             std::mt19937& rng) const
{
    const double expected = expectedFailureEvents(context, roofCoverage);
    if (expected <= 0.0) {
        return 0;
    }
    const int cap = std::clamp(m_tuning.maxFailureEvents, 0, FAILURE_EVENT_CAP);
    const double whole = std::floor(expected);
    int count = static_cast<int>(std::min(whole, static_cast<double>(cap)));
    std::bernoulli_distribution extra(expected - whole);
    if (extra(rng)) {
        ++count;
    }
    return std::min(count, cap);
}

double DecaySimulation::failureSeverity(double years)
{
    return 1.0 - std::exp(-years / FAILURE_SEVERITY_YEARS);
}

double DecaySimulation::failureFalloff(double distance, int radius)
{
    const double base = std::max(0.0, 1.0 - distance / static_cast<double>(radius + 1));
    return std::pow(base, FAILURE_FALLOFF_EXPONENT);
}

// ----------------------------------------------------------------------------
// Region passes
// ----------------------------------------------------------------------------

bool DecaySimulation::applyRot(Item& item, const DecayContext& context) const
{
    if (!item.isPerishable()) {
        return false;
    }
    const RotOutcome outcome = simulateRot(context, item.getRotProgress(), item.getRotThreshold());
    item.setRotProgress(outcome.rotProgress);
    if (outcome.rotted) {
        DECAY_DEBUG(item.getUniqueLoadId() + " rotted away at tick " + std::to_string(outcome.completionTick));
    }
    return outcome.rotted;
}

bool DecaySimulation::applyDecay(const EntityPtr& entity, const DecayContext& context, DecayReport& report) const
{
    Region* region = entity->getRegion();
    if (!region || entity->isDestroyed() || context.elapsedTicks <= 0) {
        return false;
    }
    const bool roofed = region->isRoofed(entity->getPosition());

    if (auto* item = dynamic_cast<Item*>(entity.get())) {
        if (applyRot(*item, context)) {
            ++report.rotted;
            ++report.destroyed;
            region->destroy(entity, DestroyMode::Vanish);
            return true;
        }
    }

    if (!roofed && isWeatherable(entity->getCategory())) {
        const int damage = outdoorDeterioration(context);
        if (damage > 0) {
            entity->setHitPoints(entity->getHitPoints() - damage);
            ++report.weathered;
            if (entity->getHitPoints() <= 0) {
                ++report.destroyed;
                region->destroy(entity, DestroyMode::Deteriorate);
                return true;
            }
        }
        return false;
    }

    if (auto* structure = dynamic_cast<Structure*>(entity.get())) {
        if (structure->isUnderConstruction() || structure->isNaturalRock()) {
            return false;
        }
        // Held perishables keep rotting inside their container
        const Structure::Contents held = structure->getContents();
        for (const auto& content : held) {
            auto* heldItem = dynamic_cast<Item*>(content.get());
            if (heldItem && applyRot(*heldItem, context)) {
                ++report.rotted;
                structure->removeContent(*content);
                content->markDestroyed();
                region->getWorld().forget(*content);
            }
        }

        const int damage = structuralDamage(context, *structure, roofed);
        if (damage > 0) {
            structure->setHitPoints(structure->getHitPoints() - damage);
            ++report.structuresDamaged;
            if (structure->getHitPoints() <= 0) {
                ++report.destroyed;
                region->destroy(entity, DestroyMode::Deteriorate);
                return true;
            }
        }
    }
    return false;
}

DecaySimulation::DecayReport DecaySimulation::applyToRegion(Region& region, const DecayContext& context,
                                                            const EligibilityClassifier& classifier) const
{
    DecayReport report;
    if (!m_tuning.enabled || context.elapsedTicks <= 0) {
        return report;
    }

    const std::vector<EntityPtr> snapshot = region.getEntities();
    for (const auto& entity : snapshot) {
        if (!classifier.shouldPersist(*entity)) {
            continue;
        }
        applyDecay(entity, context, report);
    }

    DECAY_INFO("Region " + std::to_string(region.getId()) + " aged " + std::to_string(context.days()) +
               " days: rotted=" + std::to_string(report.rotted) + " weathered=" + std::to_string(report.weathered) +
               " structuresDamaged=" + std::to_string(report.structuresDamaged) +
               " destroyed=" + std::to_string(report.destroyed));
    return report;
}

size_t DecaySimulation::applyFloorErosion(Region& region, const DecayContext& context, std::mt19937& rng) const
{
    if (!m_tuning.enabled || context.elapsedTicks <= 0) {
        return 0;
    }
    std::bernoulli_distribution erode(floorErosionProbability(context));
    size_t removed = 0;
    for (int z = 0; z < region.getHeight(); ++z) {
        for (int x = 0; x < region.getWidth(); ++x) {
            const CellPos cell{x, z};
            if (region.isRoofed(cell) || !region.hasConstructedFloor(cell)) {
                continue;
            }
            if (erode(rng) && region.removeFloor(cell)) {
                ++removed;
            }
        }
    }
    if (removed > 0) {
        DECAY_DEBUG("Eroded " + std::to_string(removed) + " floor cells in region " + std::to_string(region.getId()));
    }
    return removed;
}

DecaySimulation::FailureReport DecaySimulation::simulateStructuralFailures(Region& region,
                                                                           const DecayContext& context,
                                                                           std::mt19937& rng) const
{
    FailureReport report;
    if (!m_tuning.enabled || context.years() < FAILURE_MIN_YEARS) {
        return report;
    }

    std::vector<StructurePtr> candidates;
    for (const auto& entity : region.getEntities()) {
        auto structure = std::dynamic_pointer_cast<Structure>(entity);
        if (isFailureCandidate(structure)) {
            candidates.push_back(std::move(structure));
        }
    }
    if (candidates.empty()) {
        return report;
    }

    const int count = sampleFailureEventCount(context, candidateRoofCoverage(region, candidates), rng);
    for (int i = 0; i < count; ++i) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [](const StructurePtr& s) { return !isFailureCandidate(s); }),
                         candidates.end());
        if (candidates.empty()) {
            break;
        }
        applyFailureEvent(region, context, candidates, rng, report);
        ++report.events;
    }

    if (report.events > 0) {
        DECAY_INFO("Region " + std::to_string(region.getId()) + " structural failures: events=" +
                   std::to_string(report.events) + " damaged=" + std::to_string(report.structuresDamaged) +
                   " destroyed=" + std::to_string(report.structuresDestroyed) +
                   " floorsRemoved=" + std::to_string(report.floorsRemoved));
    }
    return report;
}

void DecaySimulation::applyFailureEvent(Region& region, const DecayContext& context,
                                        std::vector<StructurePtr>& candidates, std::mt19937& rng,
                                        FailureReport& report) const
{
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto& structure : candidates) {
        weights.push_back(region.isRoofed(structure->getPosition()) ? ROOFED_EPICENTER_WEIGHT
                                                                     : UNROOFED_EPICENTER_WEIGHT);
    }
    std::discrete_distribution<size_t> pickEpicenter(weights.begin(), weights.end());
    const CellPos epicenter = candidates[pickEpicenter(rng)]->getPosition();

    std::uniform_int_distribution<int> pickRadius(FAILURE_MIN_RADIUS, FAILURE_MAX_RADIUS);
    const int radius = pickRadius(rng);

    const double severity = failureSeverity(context.years());
    const double epicenterMult = region.isRoofed(epicenter) ? ROOFED_EPICENTER_MULT : 1.0;

    // Snapshot: destroying a structure may eject occupants into the region
    const std::vector<StructurePtr> targets = candidates;
    for (const auto& structure : targets) {
        if (!isFailureCandidate(structure)) {
            continue;
        }
        const double distance = structure->getPosition().distanceTo(epicenter);
        if (distance > radius) {
            continue;
        }
        const double targetMult = region.isRoofed(structure->getPosition()) ? ROOFED_TARGET_MULT : 1.0;
        const int damage = static_cast<int>(std::lround(structure->getMaxHitPoints() * severity *
                                                        failureFalloff(distance, radius) * epicenterMult *
                                                        targetMult));
        if (damage <= 0) {
            continue;
        }
        structure->setHitPoints(structure->getHitPoints() - damage);
        ++report.structuresDamaged;
        if (structure->getHitPoints() <= 0) {
            region.destroy(structure, DestroyMode::Deteriorate);
            ++report.structuresDestroyed;
        }
    }

    const int minX = std::max(0, epicenter.x - radius);
    const int maxX = std::min(region.getWidth() - 1, epicenter.x + radius);
    const int minZ = std::max(0, epicenter.z - radius);
    const int maxZ = std::min(region.getHeight() - 1, epicenter.z + radius);
    for (int z = minZ; z <= maxZ; ++z) {
        for (int x = minX; x <= maxX; ++x) {
            const CellPos cell{x, z};
            const double distance = cell.distanceTo(epicenter);
            if (distance > radius || !region.hasConstructedFloor(cell)) {
                continue;
            }
            const double cellMult = region.isRoofed(cell) ? ROOFED_TARGET_MULT : 1.0;
            std::bernoulli_distribution strip(
                std::clamp(severity * failureFalloff(distance, radius) * epicenterMult * cellMult, 0.0, 1.0));
            if (strip(rng) && region.removeFloor(cell)) {
                ++report.floorsRemoved;
            }
        }
    }
}

} // namespace Strata
