/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Header-only binary reader/writer used by floor snapshots.
 * Values are written in host byte order; snapshots are not portable between
 * machines of different endianness. Streams are held through shared_ptr with
 * a no-op deleter so the caller keeps ownership.
 */
namespace DelveEngine::BinarySerial {

// Upper bounds guarding against corrupt length prefixes and record counts
constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
constexpr uint32_t MAX_RECORD_COUNT = 1024 * 1024;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  // Wrap a caller-owned stream
  static Writer borrow(std::ostream &stream) {
    return Writer(std::shared_ptr<std::ostream>(&stream, [](std::ostream *) {
      /* no-op deleter */
    }));
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.c_str(), length);
    }
    return m_stream->good();
  }

  std::ostream &stream() { return *m_stream; }

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
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static Reader borrow(std::istream &stream) {
    return Reader(
        std::shared_ptr<std::istream>(&stream, [](std::istream *) {}));
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
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

    if (length > MAX_STRING_LENGTH) {
      SAVEGAME_ERROR("String length too large: " + std::to_string(length) +
                     " bytes");
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  std::istream &stream() { return *m_stream; }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace DelveEngine::BinarySerial

#endif // BINARY_SERIALIZER_HPP
