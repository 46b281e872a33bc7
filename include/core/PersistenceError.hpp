/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERSISTENCE_ERROR_HPP
#define PERSISTENCE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Strata {

/**
 * @brief Base class for every failure raised by the region persistence layer.
 *
 * save() and load() on the orchestrator catch these at their boundary and
 * translate them into an ArchiveResult.
 */
class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string &message)
      : std::runtime_error(message) {}
};

// Truncated, corrupt or structurally invalid archive container or record.
class ArchiveFormatError : public PersistenceError {
public:
  explicit ArchiveFormatError(const std::string &message)
      : PersistenceError("Archive format error: " + message) {}
};

// Storage root, persistent id or region id unavailable.
class MissingPrerequisiteError : public PersistenceError {
public:
  explicit MissingPrerequisiteError(const std::string &message)
      : PersistenceError("Missing prerequisite: " + message) {}
};

/**
 * @brief Two distinct objects claim the same load id during cross-reference
 * resolution.
 *
 * Carries the counts of targets known from each origin when the clash was
 * detected so the log line can tell a stale world ghost from a corrupt archive.
 */
class IdentityCollisionError : public PersistenceError {
public:
  IdentityCollisionError(const std::string &loadId, size_t archiveTargets,
                         size_t liveTargets)
      : PersistenceError("Identity collision on '" + loadId +
                         "' (archive targets: " +
                         std::to_string(archiveTargets) +
                         ", live targets: " + std::to_string(liveTargets) +
                         ")"),
        m_loadId(loadId), m_archiveTargets(archiveTargets),
        m_liveTargets(liveTargets) {}

  const std::string &getLoadId() const { return m_loadId; }
  size_t getArchiveTargetCount() const { return m_archiveTargets; }
  size_t getLiveTargetCount() const { return m_liveTargets; }

private:
  std::string m_loadId;
  size_t m_archiveTargets;
  size_t m_liveTargets;
};

} // namespace Strata

#endif // PERSISTENCE_ERROR_HPP
