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

#include "message.hpp"
#include <random>

// Source of random choices for generating D-Bus types, values and
// messages.
class DBusRandom {
public:
  virtual ~DBusRandom() {}

  // Return the signature character of a randomly chosen type. If
  // `maxdepth` is zero, the result is a basic type, never a container
  // type like an array or struct.
  // https://dbus.freedesktop.org/doc/dbus-specification.html#type-system
  virtual char randomType(const size_t maxdepth) = 0;

  // Choose a random number of fields for a struct. At least one, because
  // empty structs are not allowed.
  virtual size_t randomNumFields() = 0;

  // Choose a random number of elements for an array.
  virtual size_t randomArraySize() = 0;

  virtual char randomChar() = 0;
  virtual bool randomBoolean() = 0;
  virtual uint16_t randomUint16() = 0;
  virtual uint32_t randomUint32() = 0;
  virtual uint64_t randomUint64() = 0;
  virtual double randomDouble() = 0;
  virtual std::string randomString() = 0;
  virtual std::string randomPath() = 0;
};

// Implementation of DBusRandom, using a Mersenne Twister
// pseudo random number generator.
class DBusRandomMersenne : public DBusRandom {
  std::mt19937_64 gen_; // Random number generator

  // Budget for the total number of struct fields and array elements, to
  // stop the generated values from getting too big.
  size_t maxsize_;

public:
  DBusRandomMersenne(std::uint_fast64_t seed, size_t maxsize);

  char randomType(const size_t maxdepth) final override;

  size_t randomNumFields() final override;
  size_t randomArraySize() final override;

  char randomChar() final override;
  bool randomBoolean() final override;
  uint16_t randomUint16() final override;
  uint32_t randomUint32() final override;
  uint64_t randomUint64() final override;
  double randomDouble() final override;
  std::string randomString() final override;

  // An object path like "/a/b0/c_d", or "/".
  std::string randomPath() final override;
};

// Generate a random DBusType.
const DBusType &randomType(DBusRandom &r,
                           DBusTypeStorage &typeStorage, // Type allocator
                           const size_t maxdepth);

// Generate a random DBusObject of type `t`.
std::unique_ptr<DBusObject> randomObject(DBusRandom &r, const DBusType &t,
                                         const size_t maxdepth);

// Generate a random value for the header field `name`, with the kind that
// the field requires. `name` must be a known header field.
HeaderValue randomHeaderValue(DBusRandom &r, HeaderFieldName name);

// Generate a random message which passes `Message::validate`. The byte
// order, message type, flags and optional header fields are all random
// and the body is a random sequence of values.
std::unique_ptr<Message> randomMessage(DBusRandom &r, const size_t maxdepth);
