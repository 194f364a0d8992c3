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

#include <endian.h>
#include <stdint.h>
#include <string.h>

// The enumerator values are the byte order markers which appear in the
// first byte of every message.
enum Endianness : char {
  LittleEndian = 'l',
  BigEndian = 'B'
};

// Read an unsigned integer from a (possibly unaligned) wire buffer.
template <Endianness endianness, class T> inline T readUint(const char *buf) {
  static_assert(endianness == LittleEndian || endianness == BigEndian);
  T x;
  memcpy(&x, buf, sizeof(T));
  if constexpr (sizeof(T) == sizeof(uint16_t)) {
    return endianness == LittleEndian ? le16toh(x) : be16toh(x);
  } else if constexpr (sizeof(T) == sizeof(uint32_t)) {
    return endianness == LittleEndian ? le32toh(x) : be32toh(x);
  } else {
    static_assert(sizeof(T) == sizeof(uint64_t));
    return endianness == LittleEndian ? le64toh(x) : be64toh(x);
  }
}

// Write an unsigned integer to a (possibly unaligned) wire buffer.
template <Endianness endianness, class T> inline void writeUint(char *buf, T x) {
  static_assert(endianness == LittleEndian || endianness == BigEndian);
  if constexpr (sizeof(T) == sizeof(uint16_t)) {
    x = endianness == LittleEndian ? htole16(x) : htobe16(x);
  } else if constexpr (sizeof(T) == sizeof(uint32_t)) {
    x = endianness == LittleEndian ? htole32(x) : htobe32(x);
  } else {
    static_assert(sizeof(T) == sizeof(uint64_t));
    x = endianness == LittleEndian ? htole64(x) : htobe64(x);
  }
  memcpy(buf, &x, sizeof(T));
}
