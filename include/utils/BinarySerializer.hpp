/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <cstring>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization over shared stream handles.
 * Values are written in host byte order; every supported target is
 * little-endian.
 */
namespace Strata::BinarySerial {

// Upper bounds that catch corrupt length prefixes before allocating
inline constexpr uint32_t MAX_STRING_BYTES = 16u * 1024u * 1024u;
inline constexpr uint32_t MAX_VECTOR_BYTES = 256u * 1024u * 1024u;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeBool(bool value) { return write<uint8_t>(value ? 1 : 0); }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.data(), length);
    }
    return m_stream->good();
  }

  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    if (size > 0) {
      m_stream->write(reinterpret_cast<const char *>(vec.data()),
                      sizeof(T) * size);
    }
    return m_stream->good();
  }

  // Raw bytes without a length prefix (record payloads)
  bool writeRaw(const char *data, size_t size) {
    if (size > 0) {
      m_stream->write(data, static_cast<std::streamsize>(size));
    }
    return m_stream->good();
  }

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readBool(bool &value) {
    uint8_t raw = 0;
    if (!read(raw)) {
      return false;
    }
    value = raw != 0;
    return true;
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_BYTES) {
      ARCHIVE_ERROR("String length too large: " + std::to_string(length) +
                    " bytes");
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return !m_stream->bad() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }

    if (size == 0) {
      vec.clear();
      return true;
    }

    if (static_cast<uint64_t>(size) * sizeof(T) > MAX_VECTOR_BYTES) {
      ARCHIVE_ERROR("Vector size too large: " + std::to_string(size) +
                    " elements");
      return false;
    }

    vec.resize(size);
    m_stream->read(reinterpret_cast<char *>(vec.data()), sizeof(T) * size);
    return !m_stream->bad() &&
           m_stream->gcount() == static_cast<std::streamsize>(sizeof(T) * size);
  }

  bool readRaw(std::string &out, size_t size) {
    out.resize(size);
    if (size == 0) {
      return true;
    }
    m_stream->read(&out[0], static_cast<std::streamsize>(size));
    return !m_stream->bad() &&
           m_stream->gcount() == static_cast<std::streamsize>(size);
  }

  // True once every byte of the underlying stream has been consumed
  bool atEnd() const {
    return m_stream->peek() == std::char_traits<char>::eof();
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace Strata::BinarySerial

#endif // BINARY_SERIALIZER_HPP
