/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef REGION_COMPONENT_HPP
#define REGION_COMPONENT_HPP

#include "persistence/Archivable.hpp"
#include <memory>
#include <string>

namespace Strata {

class Region;

/**
 * @brief Base for subsystems that live exactly as long as one region.
 */
class RegionComponent {
public:
    explicit RegionComponent(Region& region) : m_region(region) {}
    virtual ~RegionComponent() = default;

    Region& getRegion() const { return m_region; }

protected:
    Region& m_region;
};

/**
 * @brief Opt-in marker for region components whose state rides inside the
 * region archive.
 *
 * Each persisted component gets its own record, named after the sanitized
 * getArchiveTag(). Components are constructed by the region, never by the
 * archive; a missing record leaves the component at its defaults.
 */
class IPersistableRegionComponent : public IArchivable {
public:
    ~IPersistableRegionComponent() override = default;
};

/**
 * @brief Record name for a component type name: ':', '.', '+', '<', '>',
 * ',' and spaces become '_'.
 */
std::string sanitizeComponentRecordName(const std::string& typeName);

} // namespace Strata

#endif // REGION_COMPONENT_HPP
