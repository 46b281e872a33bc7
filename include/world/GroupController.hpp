/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GROUP_CONTROLLER_HPP
#define GROUP_CONTROLLER_HPP

#include "entities/Creature.hpp"
#include "entities/Faction.hpp"
#include "persistence/ArchiveSession.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Strata {

class GroupManager;
class Region;

/**
 * @brief AI group coordinating a set of creatures inside one region (a raid
 * party, a dormant mechanoid cluster, a herd).
 *
 * Archived together with the creatures it owns; the owned list is a list of
 * cross-references resolved after load.
 */
class GroupController : public ILoadReferenceable,
                        public IArchivable,
                        public std::enable_shared_from_this<GroupController> {
public:
    GroupController();
    GroupController(std::string label, FactionPtr faction);

    uint64_t getId() const { return m_id; }
    const std::string& getLabel() const { return m_label; }
    const FactionPtr& getFaction() const { return m_faction; }

    const std::vector<CreaturePtr>& getOwnedCreatures() const { return m_owned; }
    void addOwned(const CreaturePtr& creature);
    bool removeOwned(const Creature& creature);
    bool owns(const Creature& creature) const;

    GroupManager* getManager() const { return m_manager; }
    void setManager(GroupManager* manager) { m_manager = manager; }

    std::string getUniqueLoadId() const override { return "Group_" + std::to_string(m_id); }

    std::string getArchiveTag() const override { return "GroupController"; }
    void save(ArchiveWriter& writer) const override;
    void load(ArchiveReader& reader) override;
    void resolveReferences(CrossReferenceResolver& resolver) override;
    void postLoadInit() override;

    static const DeepFactory<GroupController>& deepFactory();

private:
    uint64_t m_id;
    std::string m_label;
    FactionPtr m_faction;
    std::vector<CreaturePtr> m_owned;
    GroupManager* m_manager{nullptr};

    std::string m_pendingFactionRef;
    std::vector<std::string> m_pendingOwnedRefs;
};

using GroupControllerPtr = std::shared_ptr<GroupController>;

/**
 * @brief The live group list of one region.
 */
class GroupManager {
public:
    explicit GroupManager(Region& region) : m_region(region) {}

    Region& getRegion() const { return m_region; }

    /**
     * @brief Adds a group and registers it in the world identity registry.
     * @throws IdentityCollisionError if another object holds its load id
     */
    void add(const GroupControllerPtr& group);
    bool remove(const GroupControllerPtr& group);
    void clear();

    const std::vector<GroupControllerPtr>& getGroups() const { return m_groups; }
    bool contains(const GroupController& group) const;

private:
    Region& m_region;
    std::vector<GroupControllerPtr> m_groups;
};

} // namespace Strata

#endif // GROUP_CONTROLLER_HPP
