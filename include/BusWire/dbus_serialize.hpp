// Copyright 2020-2024 Kevin Backhouse.
//
// This file is part of BusWire.
//
// BusWire is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// BusWire is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with BusWire.  If not, see <https://www.gnu.org/licenses/>.


#pragma once

#include "dbus.hpp"
#include <string.h>
#include <vector>

// Serializing takes two passes. The first pass, `SerializerInitArraySizes`,
// computes the total size and the size of every array. The second pass
// writes the bytes, using the array sizes from the first pass.
//
//   std::vector<uint32_t> arraySizes;
//   SerializerInitArraySizes s0(arraySizes);
//   obj.serialize(s0);
//   std::vector<char> buf(s0.getPos());
//   SerializeToBuffer<LittleEndian> s1(arraySizes, buf.data());
//   obj.serialize(s1);

inline size_t alignup(size_t pos, size_t alignment) {
  return pos + paddingFor(pos, alignment);
}

class SerializerDryRunBase : public Serializer {
  size_t pos_;

public:
  SerializerDryRunBase() : pos_(0) {}

  void writeByte(char) override { pos_ += sizeof(char); }
  void writeBytes(const char*, size_t bufsize) override { pos_ += bufsize; }
  void writeUint16(uint16_t) override { pos_ += sizeof(uint16_t); }
  void writeUint32(uint32_t) override { pos_ += sizeof(uint32_t); }
  void writeUint64(uint64_t) override { pos_ += sizeof(uint64_t); }
  void writeDouble(double) override { pos_ += sizeof(double); }

  void insertPadding(size_t alignment) override {
    pos_ = alignup(pos_, alignment);
  }

  size_t getPos() const override { return pos_; }
};

// Only counts bytes. The array sizes are not recorded.
class SerializerDryRun final : public SerializerDryRunBase {
  size_t arrayCount_;

public:
  SerializerDryRun() : arrayCount_(0) {}

  size_t getArrayCount() const { return arrayCount_; }

  void recordArraySize(const std::function<uint32_t(uint32_t)>& f) override;
};

class SerializerInitArraySizes final : public SerializerDryRunBase {
  std::vector<uint32_t>& arraySizes_; // Not owned

public:
  explicit SerializerInitArraySizes(std::vector<uint32_t>& arraySizes) :
    arraySizes_(arraySizes)
  {}

  void recordArraySize(const std::function<uint32_t(uint32_t)>& f) override;
};

// Base class of the serializers which write bytes. The integers are
// written in the byte order given by `endianness`.
template <Endianness endianness>
class SerializeWithEndianness : public Serializer {
  size_t arrayCount_;
  const std::vector<uint32_t>& arraySizes_; // Not owned

public:
  explicit SerializeWithEndianness(const std::vector<uint32_t>& arraySizes) :
    arrayCount_(0), arraySizes_(arraySizes)
  {}

  void writeUint16(uint16_t x) override {
    char buf[sizeof(x)];
    writeUint<endianness>(buf, x);
    writeBytes(buf, sizeof(buf));
  }

  void writeUint32(uint32_t x) override {
    char buf[sizeof(x)];
    writeUint<endianness>(buf, x);
    writeBytes(buf, sizeof(buf));
  }

  void writeUint64(uint64_t x) override {
    char buf[sizeof(x)];
    writeUint<endianness>(buf, x);
    writeBytes(buf, sizeof(buf));
  }

  void writeDouble(double d) override {
    static_assert(sizeof(double) == sizeof(uint64_t));
    uint64_t x;
    memcpy(&x, &d, sizeof(x));
    writeUint64(x);
  }

  void insertPadding(size_t alignment) override {
    static const char zeros[8] = {0};
    const size_t n = paddingFor(getPos(), alignment);
    assert(n <= sizeof(zeros));
    writeBytes(zeros, n);
  }

  void recordArraySize(const std::function<uint32_t(uint32_t)>& f) override {
    (void)f(arraySizes_.at(arrayCount_++));
  }
};

// Writes into a buffer which must be big enough. The size can be
// calculated with `SerializerInitArraySizes`.
template <Endianness endianness>
class SerializeToBuffer final : public SerializeWithEndianness<endianness> {
  size_t pos_;
  char* buf_; // Not owned by this class

public:
  SerializeToBuffer(const std::vector<uint32_t>& arraySizes, char* buf) :
    SerializeWithEndianness<endianness>(arraySizes), pos_(0), buf_(buf)
  {}

  void writeByte(char c) override {
    buf_[pos_] = c;
    pos_ += sizeof(char);
  }

  void writeBytes(const char* buf, size_t bufsize) override {
    memcpy(&buf_[pos_], buf, bufsize);
    pos_ += bufsize;
  }

  size_t getPos() const override { return pos_; }
};

template <Endianness endianness>
class SerializeToString final : public SerializeWithEndianness<endianness> {
  std::string& str_; // Not owned

public:
  SerializeToString(const std::vector<uint32_t>& arraySizes, std::string& str) :
    SerializeWithEndianness<endianness>(arraySizes), str_(str)
  {}

  void writeByte(char c) override { str_.push_back(c); }

  void writeBytes(const char* buf, size_t bufsize) override {
    str_.append(buf, bufsize);
  }

  size_t getPos() const override { return str_.size(); }
};
