/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/ArchiveSession.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace Strata {

uint64_t computeArchiveChecksum(const std::string &bytes) {
  uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

// ArchiveWriter

void ArchiveWriter::writeBool(const std::string &name, bool value) {
  writeName(name);
  check(m_out.writeBool(value), name);
}

void ArchiveWriter::writeString(const std::string &name,
                                const std::string &value) {
  writeName(name);
  check(m_out.writeString(value), name);
}

void ArchiveWriter::writeGrid(const std::string &name,
                              const std::optional<std::vector<uint8_t>> &bytes) {
  writeName(name);
  check(m_out.writeBool(bytes.has_value()), name);
  if (bytes) {
    check(m_out.writeVector(*bytes), name);
  }
}

void ArchiveWriter::writeReference(const std::string &name,
                                   const ILoadReferenceable *target) {
  writeName(name);
  check(m_out.writeString(target ? target->getUniqueLoadId() : std::string()),
        name);
}

void ArchiveWriter::writeDeep(const std::string &name,
                              const IArchivable *object) {
  writeName(name);
  writeDeepBody(object);
}

void ArchiveWriter::writeName(const std::string &name) {
  check(m_out.writeString(name), name);
}

void ArchiveWriter::writeDeepBody(const IArchivable *object) {
  if (!object) {
    check(m_out.writeString(std::string()), "<deep>");
    return;
  }

  auto buffer = std::make_shared<std::ostringstream>(std::ios::binary);
  {
    BinarySerial::Writer bodyWriter(buffer);
    ArchiveWriter nested(bodyWriter);
    object->save(nested);
  }
  const std::string body = buffer->str();
  const std::string tag = object->getArchiveTag();

  check(m_out.writeString(tag), tag);
  check(m_out.write(static_cast<uint32_t>(body.size())), tag);
  check(m_out.writeRaw(body.data(), body.size()), tag);
}

void ArchiveWriter::check(bool ok, const std::string &field) {
  if (!ok) {
    throw ArchiveFormatError("write failed for field '" + field + "'");
  }
}

// ArchiveReader

bool ArchiveReader::readBool(const std::string &name) {
  expectName(name);
  bool value = false;
  if (!m_in.readBool(value)) {
    fail("truncated bool for field '" + name + "'");
  }
  return value;
}

void ArchiveReader::readString(const std::string &name, std::string &value) {
  expectName(name);
  if (!m_in.readString(value)) {
    fail("truncated string for field '" + name + "'");
  }
}

void ArchiveReader::readGrid(const std::string &name,
                             std::optional<std::vector<uint8_t>> &bytes) {
  expectName(name);
  bool present = false;
  if (!m_in.readBool(present)) {
    fail("truncated grid flag for field '" + name + "'");
  }
  if (!present) {
    bytes.reset();
    return;
  }
  std::vector<uint8_t> data;
  if (!m_in.readVector(data)) {
    fail("truncated grid for field '" + name + "'");
  }
  bytes = std::move(data);
}

std::string ArchiveReader::readReference(const std::string &name) {
  expectName(name);
  std::string loadId;
  if (!m_in.readString(loadId)) {
    fail("truncated reference for field '" + name + "'");
  }
  return loadId;
}

std::vector<std::string>
ArchiveReader::readReferenceList(const std::string &name) {
  expectName(name);
  uint32_t count = 0;
  if (!m_in.read(count)) {
    fail("truncated reference list for field '" + name + "'");
  }
  std::vector<std::string> ids;
  ids.reserve(std::min<uint32_t>(count, 4096));
  for (uint32_t i = 0; i < count; ++i) {
    std::string loadId;
    if (!m_in.readString(loadId)) {
      fail("truncated reference list for field '" + name + "'");
    }
    ids.push_back(std::move(loadId));
  }
  return ids;
}

bool ArchiveReader::readTaggedBody(std::string &tag, std::string &body) {
  if (!m_in.readString(tag)) {
    fail("truncated deep object tag");
  }
  if (tag.empty()) {
    return false;
  }
  uint32_t length = 0;
  if (!m_in.read(length) || !m_in.readRaw(body, length)) {
    fail("truncated body for deep object '" + tag + "'");
  }
  return true;
}

void ArchiveReader::registerLoaded(const std::shared_ptr<IArchivable> &object) {
  if (m_session) {
    m_session->registerDeepObject(object);
  }
}

void ArchiveReader::skippedUnknownTag(const std::string &tag) {
  ARCHIVE_WARN("Skipping deep object with unknown tag '" + tag + "'");
}

void ArchiveReader::expectName(const std::string &name) {
  std::string found;
  if (!m_in.readString(found)) {
    fail("truncated record while expecting field '" + name + "'");
  }
  if (found != name) {
    fail("expected field '" + name + "', found '" + found + "'");
  }
}

void ArchiveReader::fail(const std::string &message) {
  throw ArchiveFormatError(message);
}

// ArchiveSaveSession

ArchiveSaveSession::ArchiveSaveSession(std::string path, std::string kind)
    : m_path(std::move(path)), m_tempPath(m_path + ".tmp"),
      m_kind(std::move(kind)) {}

ArchiveSaveSession::~ArchiveSaveSession() {
  if (!m_finalized) {
    std::error_code ec;
    std::filesystem::remove(m_tempPath, ec);
  }
}

void ArchiveSaveSession::writeRecord(
    const std::string &name, const std::function<void(ArchiveWriter &)> &body) {
  if (m_finalized) {
    throw PersistenceError("Cannot add record '" + name +
                           "' to a finalized archive");
  }
  for (const auto &[existing, _] : m_records) {
    if (existing == name) {
      throw PersistenceError("Duplicate archive record '" + name + "'");
    }
  }

  auto buffer = std::make_shared<std::ostringstream>(std::ios::binary);
  {
    BinarySerial::Writer recordWriter(buffer);
    ArchiveWriter writer(recordWriter);
    body(writer);
  }
  m_records.emplace_back(name, buffer->str());
}

size_t ArchiveSaveSession::getRecordBytes(const std::string &name) const {
  for (const auto &[recordName, bytes] : m_records) {
    if (recordName == name) {
      return bytes.size();
    }
  }
  return 0;
}

void ArchiveSaveSession::finalize() {
  if (m_finalized) {
    return;
  }

  // Record section first so the header can carry its checksum
  auto records = std::make_shared<std::ostringstream>(std::ios::binary);
  {
    BinarySerial::Writer writer(records);
    for (const auto &[name, bytes] : m_records) {
      if (!writer.writeString(name) ||
          !writer.write(static_cast<uint32_t>(bytes.size())) ||
          !writer.writeRaw(bytes.data(), bytes.size())) {
        throw PersistenceError("Failed to encode record '" + name + "'");
      }
    }
  }
  const std::string recordBytes = records->str();

  {
    auto file = std::make_shared<std::ofstream>(
        m_tempPath, std::ios::binary | std::ios::trunc);
    if (!file->is_open()) {
      throw PersistenceError("Failed to open temporary archive file: " +
                             m_tempPath);
    }

    BinarySerial::Writer writer(file);
    bool ok = writer.writeRaw(ArchiveHeader::SIGNATURE,
                              ArchiveHeader::SIGNATURE_LENGTH) &&
              writer.write(ArchiveHeader::CURRENT_VERSION) &&
              writer.writeString(m_kind) &&
              writer.write(static_cast<uint32_t>(m_records.size())) &&
              writer.write(computeArchiveChecksum(recordBytes)) &&
              writer.writeRaw(recordBytes.data(), recordBytes.size());
    writer.flush();
    if (!ok || !writer.good()) {
      throw PersistenceError("Failed to write temporary archive file: " +
                             m_tempPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(m_tempPath, m_path, ec);
  if (ec) {
    throw PersistenceError("Failed to move archive into place: " + m_path +
                           " (" + ec.message() + ")");
  }

  m_finalized = true;
  ARCHIVE_DEBUG("Finalized archive " + m_path + " with " +
                std::to_string(m_records.size()) + " records");
}

// ArchiveLoadSession

ArchiveLoadSession::ArchiveLoadSession(const std::string &path,
                                       const std::string &expectedKind)
    : m_path(path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ArchiveFormatError("cannot open archive file: " + path);
  }
  std::string contents((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  if (contents.empty()) {
    throw ArchiveFormatError("archive file is empty: " + path);
  }

  auto stream = std::make_shared<std::istringstream>(std::move(contents));
  BinarySerial::Reader reader(stream);

  std::string signature;
  if (!reader.readRaw(signature, ArchiveHeader::SIGNATURE_LENGTH) ||
      signature != ArchiveHeader::SIGNATURE) {
    throw ArchiveFormatError("bad signature in " + path);
  }
  if (!reader.read(m_header.version) || !reader.readString(m_header.kind) ||
      !reader.read(m_header.recordCount) || !reader.read(m_header.checksum)) {
    throw ArchiveFormatError("truncated header in " + path);
  }
  if (m_header.version == 0 ||
      m_header.version > ArchiveHeader::CURRENT_VERSION) {
    throw ArchiveFormatError("unsupported format version " +
                             std::to_string(m_header.version) + " in " + path);
  }
  if (m_header.kind != expectedKind) {
    throw ArchiveFormatError("expected a '" + expectedKind +
                             "' archive, found '" + m_header.kind + "'");
  }

  const std::string &all = stream->str();
  const auto recordStart = static_cast<size_t>(stream->tellg());
  const std::string recordBytes = all.substr(recordStart);
  if (computeArchiveChecksum(recordBytes) != m_header.checksum) {
    throw ArchiveFormatError("checksum mismatch in " + path);
  }

  for (uint32_t i = 0; i < m_header.recordCount; ++i) {
    std::string name;
    uint32_t length = 0;
    std::string payload;
    if (!reader.readString(name) || !reader.read(length) ||
        !reader.readRaw(payload, length)) {
      throw ArchiveFormatError("truncated record table in " + path);
    }
    if (m_records.count(name) != 0) {
      throw ArchiveFormatError("duplicate record '" + name + "' in " + path);
    }
    m_recordOrder.push_back(name);
    m_records.emplace(std::move(name), std::move(payload));
  }

  if (!reader.atEnd()) {
    throw ArchiveFormatError("trailing bytes after record table in " + path);
  }

  ARCHIVE_DEBUG("Opened archive " + path + " (" +
                std::to_string(m_recordOrder.size()) + " records)");
}

bool ArchiveLoadSession::hasRecord(const std::string &name) const {
  return m_records.find(name) != m_records.end();
}

bool ArchiveLoadSession::readRecord(
    const std::string &name, const std::function<void(ArchiveReader &)> &body) {
  requireMode(SessionMode::LoadingVars, "readRecord");

  auto it = m_records.find(name);
  if (it == m_records.end()) {
    return false;
  }

  auto stream = std::make_shared<std::istringstream>(it->second);
  BinarySerial::Reader recordReader(stream);
  ArchiveReader reader(recordReader, this);
  try {
    body(reader);
  } catch (const ArchiveFormatError &e) {
    throw ArchiveFormatError("record '" + name + "': " + e.what());
  }

  if (!recordReader.atEnd()) {
    ARCHIVE_WARN("Record '" + name + "' has unread trailing data");
  }
  return true;
}

void ArchiveLoadSession::registerDeepObject(
    const std::shared_ptr<IArchivable> &object) {
  if (!object) {
    return;
  }
  m_touched.push_back(object);
  if (auto target = std::dynamic_pointer_cast<ILoadReferenceable>(object)) {
    m_resolver.registerTarget(target, ReferenceOrigin::ArchiveSession);
  }
}

void ArchiveLoadSession::addTouchedObject(
    const std::shared_ptr<IArchivable> &object) {
  if (object) {
    m_touched.push_back(object);
  }
}

void ArchiveLoadSession::preRegisterLiveTargets(
    const std::vector<ReferenceablePtr> &liveObjects) {
  requireMode(SessionMode::LoadingVars, "preRegisterLiveTargets");
  for (const auto &object : liveObjects) {
    m_resolver.registerTarget(object, ReferenceOrigin::LiveWorld);
  }
}

void ArchiveLoadSession::closeReadingCursor() {
  requireMode(SessionMode::LoadingVars, "closeReadingCursor");
  m_records.clear();
  m_mode = SessionMode::ResolvingCrossRefs;
}

void ArchiveLoadSession::resolveAllCrossReferences() {
  requireMode(SessionMode::ResolvingCrossRefs, "resolveAllCrossReferences");
  for (const auto &object : m_touched) {
    object->resolveReferences(m_resolver);
  }
  m_mode = SessionMode::PostLoadInit;

  if (m_resolver.getUnresolvedCount() > 0) {
    ARCHIVE_WARN(std::to_string(m_resolver.getUnresolvedCount()) +
                 " references in " + m_path + " could not be resolved");
  }
}

void ArchiveLoadSession::doAllPostLoadInits() {
  requireMode(SessionMode::PostLoadInit, "doAllPostLoadInits");
  for (const auto &object : m_touched) {
    object->postLoadInit();
  }
  m_mode = SessionMode::Complete;
}

void ArchiveLoadSession::requireMode(SessionMode expected,
                                     const char *operation) const {
  if (m_mode != expected) {
    throw PersistenceError(std::string("Archive session operation '") +
                           operation + "' called in the wrong phase");
  }
}

} // namespace Strata
