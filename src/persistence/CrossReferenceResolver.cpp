/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/CrossReferenceResolver.hpp"
#include "core/Logger.hpp"
#include "core/PersistenceError.hpp"

namespace Strata {

void CrossReferenceResolver::registerTarget(const ReferenceablePtr &target,
                                            ReferenceOrigin origin) {
  if (!target) {
    return;
  }

  const std::string loadId = target->getUniqueLoadId();
  auto it = m_targets.find(loadId);
  if (it != m_targets.end()) {
    if (it->second.object == target) {
      return;
    }
    throw IdentityCollisionError(loadId, m_archiveTargets, m_liveTargets);
  }

  m_targets.emplace(loadId, Target{target, origin});
  if (origin == ReferenceOrigin::ArchiveSession) {
    ++m_archiveTargets;
  } else {
    ++m_liveTargets;
  }
}

void CrossReferenceResolver::clear() {
  m_targets.clear();
  m_archiveTargets = 0;
  m_liveTargets = 0;
  m_resolvedCount = 0;
  m_unresolvedCount = 0;
}

void CrossReferenceResolver::noteUnresolved(const std::string &loadId,
                                            const char *reason) {
  ++m_unresolvedCount;
  ARCHIVE_WARN("Could not resolve reference '" + loadId + "': " + reason);
}

} // namespace Strata
