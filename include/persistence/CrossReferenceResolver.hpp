/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CROSS_REFERENCE_RESOLVER_HPP
#define CROSS_REFERENCE_RESOLVER_HPP

#include "persistence/Archivable.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace Strata {

enum class ReferenceOrigin : uint8_t { ArchiveSession, LiveWorld };

/**
 * @brief Single directory of reference targets for one load session.
 *
 * Targets come from two places: objects deserialized in the session and
 * objects already alive in the world. Both share one namespace of load ids,
 * so a clash between them (or within either) is reported as an
 * IdentityCollisionError instead of silently picking one.
 */
class CrossReferenceResolver {
public:
  /**
   * @brief Adds a target. Registering the same object twice is a no-op.
   * @throws IdentityCollisionError if another object already owns the id
   */
  void registerTarget(const ReferenceablePtr &target, ReferenceOrigin origin);

  /**
   * @brief Looks up a load id. An empty id means "no reference" and yields
   * nullptr without counting as unresolved.
   */
  template <typename T>
  std::shared_ptr<T> resolve(const std::string &loadId) {
    if (loadId.empty()) {
      return nullptr;
    }
    auto it = m_targets.find(loadId);
    if (it == m_targets.end()) {
      noteUnresolved(loadId, "no target registered");
      return nullptr;
    }
    auto typed = std::dynamic_pointer_cast<T>(it->second.object);
    if (!typed) {
      noteUnresolved(loadId, "target has an unexpected type");
      return nullptr;
    }
    ++m_resolvedCount;
    return typed;
  }

  bool contains(const std::string &loadId) const {
    return m_targets.find(loadId) != m_targets.end();
  }
  size_t getTargetCount(ReferenceOrigin origin) const {
    return origin == ReferenceOrigin::ArchiveSession ? m_archiveTargets
                                                     : m_liveTargets;
  }
  size_t getResolvedCount() const { return m_resolvedCount; }
  size_t getUnresolvedCount() const { return m_unresolvedCount; }

  void clear();

private:
  struct Target {
    ReferenceablePtr object;
    ReferenceOrigin origin;
  };

  void noteUnresolved(const std::string &loadId, const char *reason);

  std::unordered_map<std::string, Target> m_targets;
  size_t m_archiveTargets{0};
  size_t m_liveTargets{0};
  size_t m_resolvedCount{0};
  size_t m_unresolvedCount{0};
};

} // namespace Strata

#endif // CROSS_REFERENCE_RESOLVER_HPP
