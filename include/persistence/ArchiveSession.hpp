/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARCHIVE_SESSION_HPP
#define ARCHIVE_SESSION_HPP

#include "core/PersistenceError.hpp"
#include "persistence/Archivable.hpp"
#include "persistence/CrossReferenceResolver.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Strata {

class ArchiveLoadSession;

/**
 * Container layout shared by region archives and world session files:
 *
 *   "STRATAARC"  u32 version  string kind  u32 recordCount  u64 checksum
 *   recordCount x { string name, u32 length, length bytes }
 *
 * The checksum is FNV-1a over everything after the header. Inside a record
 * every field is written as {name, value} and read back with a name check.
 */
struct ArchiveHeader {
  static constexpr char SIGNATURE[10] = "STRATAARC";
  static constexpr size_t SIGNATURE_LENGTH = 9;
  static constexpr uint32_t CURRENT_VERSION = 1;

  uint32_t version{CURRENT_VERSION};
  std::string kind;
  uint32_t recordCount{0};
  uint64_t checksum{0};
};

uint64_t computeArchiveChecksum(const std::string &bytes);

template <typename T>
using DeepFactory = std::function<std::shared_ptr<T>(const std::string &tag)>;

/**
 * @brief Named-field writer for one record.
 *
 * All write functions throw ArchiveFormatError if the underlying stream
 * fails.
 */
class ArchiveWriter {
public:
  explicit ArchiveWriter(BinarySerial::Writer &out) : m_out(out) {}

  template <typename T> void writeValue(const std::string &name, const T &value) {
    writeName(name);
    check(m_out.write(value), name);
  }

  void writeBool(const std::string &name, bool value);
  void writeString(const std::string &name, const std::string &value);

  template <typename T>
  void writeVector(const std::string &name, const std::vector<T> &values) {
    writeName(name);
    check(m_out.writeVector(values), name);
  }

  // Optional byte layer; absence is written explicitly
  void writeGrid(const std::string &name,
                 const std::optional<std::vector<uint8_t>> &bytes);

  // Stores the target's load id, or an empty id for nullptr
  void writeReference(const std::string &name,
                      const ILoadReferenceable *target);

  template <typename Range>
  void writeReferenceList(const std::string &name, const Range &targets) {
    writeName(name);
    uint32_t count = 0;
    for (const auto &target : targets) {
      (void)target;
      ++count;
    }
    check(m_out.write(count), name);
    for (const auto &target : targets) {
      check(m_out.writeString(target ? target->getUniqueLoadId()
                                     : std::string()),
            name);
    }
  }

  // Full copy of an object, prefixed with its archive tag
  void writeDeep(const std::string &name, const IArchivable *object);

  template <typename Range>
  void writeDeepList(const std::string &name, const Range &objects) {
    writeName(name);
    uint32_t count = 0;
    for (const auto &object : objects) {
      (void)object;
      ++count;
    }
    check(m_out.write(count), name);
    for (const auto &object : objects) {
      writeDeepBody(object.get());
    }
  }

private:
  void writeName(const std::string &name);
  void writeDeepBody(const IArchivable *object);
  void check(bool ok, const std::string &field);

  BinarySerial::Writer &m_out;
};

/**
 * @brief Named-field reader for one record.
 *
 * Every read verifies the field name first; a mismatch or short read throws
 * ArchiveFormatError. Deep objects are handed to the owning session so they
 * take part in reference resolution and post-load initialization.
 */
class ArchiveReader {
public:
  ArchiveReader(BinarySerial::Reader &in, ArchiveLoadSession *session)
      : m_in(in), m_session(session) {}

  template <typename T> void readValue(const std::string &name, T &value) {
    expectName(name);
    if (!m_in.read(value)) {
      fail("truncated value for field '" + name + "'");
    }
  }

  bool readBool(const std::string &name);
  void readString(const std::string &name, std::string &value);

  template <typename T>
  void readVector(const std::string &name, std::vector<T> &values) {
    expectName(name);
    if (!m_in.readVector(values)) {
      fail("truncated vector for field '" + name + "'");
    }
  }

  void readGrid(const std::string &name,
                std::optional<std::vector<uint8_t>> &bytes);

  std::string readReference(const std::string &name);
  std::vector<std::string> readReferenceList(const std::string &name);

  template <typename T>
  std::shared_ptr<T> readDeep(const std::string &name,
                              const DeepFactory<T> &factory) {
    expectName(name);
    return readDeepBody(factory);
  }

  template <typename T, typename Container>
  void readDeepList(const std::string &name, Container &out,
                    const DeepFactory<T> &factory) {
    expectName(name);
    uint32_t count = 0;
    if (!m_in.read(count)) {
      fail("truncated list count for field '" + name + "'");
    }
    for (uint32_t i = 0; i < count; ++i) {
      if (auto object = readDeepBody(factory)) {
        out.push_back(std::move(object));
      }
    }
  }

private:
  template <typename T>
  std::shared_ptr<T> readDeepBody(const DeepFactory<T> &factory) {
    std::string tag;
    std::string body;
    if (!readTaggedBody(tag, body)) {
      return nullptr;
    }

    std::shared_ptr<T> object = factory(tag);
    if (!object) {
      skippedUnknownTag(tag);
      return nullptr;
    }

    auto stream = std::make_shared<std::istringstream>(std::move(body));
    BinarySerial::Reader bodyReader(stream);
    ArchiveReader nested(bodyReader, m_session);
    object->load(nested);
    registerLoaded(object);
    return object;
  }

  // False for an explicitly empty slot (nullptr was written)
  bool readTaggedBody(std::string &tag, std::string &body);
  void registerLoaded(const std::shared_ptr<IArchivable> &object);
  void skippedUnknownTag(const std::string &tag);
  void expectName(const std::string &name);
  [[noreturn]] void fail(const std::string &message);

  BinarySerial::Reader &m_in;
  ArchiveLoadSession *m_session;
};

/**
 * @brief Collects records in memory and writes them as one archive file.
 *
 * Nothing touches the disk until finalize(), which writes a temporary
 * sibling file and renames it over the destination. A session destroyed
 * without finalize() leaves no file behind.
 */
class ArchiveSaveSession {
public:
  ArchiveSaveSession(std::string path, std::string kind);
  ~ArchiveSaveSession();

  ArchiveSaveSession(const ArchiveSaveSession &) = delete;
  ArchiveSaveSession &operator=(const ArchiveSaveSession &) = delete;

  void writeRecord(const std::string &name,
                   const std::function<void(ArchiveWriter &)> &body);

  void finalize();

  bool isFinalized() const { return m_finalized; }
  size_t getRecordCount() const { return m_records.size(); }
  size_t getRecordBytes(const std::string &name) const;
  const std::string &getPath() const { return m_path; }

private:
  std::string m_path;
  std::string m_tempPath;
  std::string m_kind;
  std::vector<std::pair<std::string, std::string>> m_records;
  bool m_finalized{false};
};

enum class SessionMode : uint8_t {
  LoadingVars,
  ResolvingCrossRefs,
  PostLoadInit,
  Complete
};

/**
 * @brief Reads one archive file and drives the load passes over it.
 *
 * The constructor reads the whole file and validates the container (header,
 * checksum, record table) before any record is interpreted. Records are then
 * read in LoadingVars mode; closeReadingCursor() releases the raw bytes,
 * resolveAllCrossReferences() runs exactly once, and doAllPostLoadInits()
 * finishes the session.
 */
class ArchiveLoadSession {
public:
  ArchiveLoadSession(const std::string &path, const std::string &expectedKind);

  ArchiveLoadSession(const ArchiveLoadSession &) = delete;
  ArchiveLoadSession &operator=(const ArchiveLoadSession &) = delete;

  const std::string &getPath() const { return m_path; }
  const ArchiveHeader &getHeader() const { return m_header; }
  bool hasRecord(const std::string &name) const;
  const std::vector<std::string> &getRecordNames() const {
    return m_recordOrder;
  }

  /**
   * @brief Runs @p body over the named record.
   * @return false if the record is absent
   */
  bool readRecord(const std::string &name,
                  const std::function<void(ArchiveReader &)> &body);

  // Deserialized identity-bearing object: becomes a resolution target
  void registerDeepObject(const std::shared_ptr<IArchivable> &object);
  // Live object that loaded data in this session but is not a target
  void addTouchedObject(const std::shared_ptr<IArchivable> &object);

  void preRegisterLiveTargets(const std::vector<ReferenceablePtr> &liveObjects);

  void closeReadingCursor();
  void resolveAllCrossReferences();
  void doAllPostLoadInits();

  SessionMode getMode() const { return m_mode; }
  CrossReferenceResolver &getResolver() { return m_resolver; }
  size_t getTouchedCount() const { return m_touched.size(); }

private:
  void requireMode(SessionMode expected, const char *operation) const;

  std::string m_path;
  ArchiveHeader m_header;
  std::unordered_map<std::string, std::string> m_records;
  std::vector<std::string> m_recordOrder;
  std::vector<std::shared_ptr<IArchivable>> m_touched;
  CrossReferenceResolver m_resolver;
  SessionMode m_mode{SessionMode::LoadingVars};
};

} // namespace Strata

#endif // ARCHIVE_SESSION_HPP
