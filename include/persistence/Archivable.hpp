/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVABLE_HPP
#define ARCHIVABLE_HPP

#include <memory>
#include <string>

namespace Strata {

class ArchiveWriter;
class ArchiveReader;
class CrossReferenceResolver;

/**
 * @brief An object other archived objects may point at by load id.
 */
class ILoadReferenceable {
public:
  virtual ~ILoadReferenceable() = default;
  virtual std::string getUniqueLoadId() const = 0;
};

using ReferenceablePtr = std::shared_ptr<ILoadReferenceable>;

/**
 * @brief An object that can be written into and read back from an archive
 * session.
 *
 * Loading happens in three passes: load() reads plain fields and remembers
 * the load ids of referenced objects, resolveReferences() turns those ids
 * into pointers once every target is known, postLoadInit() restores derived
 * state.
 */
class IArchivable {
public:
  virtual ~IArchivable() = default;

  // Type tag written in front of deep-saved objects and used by factories
  virtual std::string getArchiveTag() const = 0;

  virtual void save(ArchiveWriter &writer) const = 0;
  virtual void load(ArchiveReader &reader) = 0;
  virtual void resolveReferences(CrossReferenceResolver &) {}
  virtual void postLoadInit() {}
};

} // namespace Strata

#endif // ARCHIVABLE_HPP
