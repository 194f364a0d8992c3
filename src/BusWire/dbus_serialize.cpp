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

#include "dbus_serialize.hpp"

void SerializerDryRun::recordArraySize(
    const std::function<uint32_t(uint32_t)> &f) {
  (void)f(0);
  ++arrayCount_;
}

void SerializerInitArraySizes::recordArraySize(
    const std::function<uint32_t(uint32_t)> &f) {
  // Reserve the slot before running `f`, because nested arrays add their
  // own slots while `f` is running.
  const size_t i = arraySizes_.size();
  arraySizes_.push_back(0);
  arraySizes_[i] = f(0);
}

// Signatures only contain ASCII characters, so no array sizes are
// needed and the byte order doesn't matter.
template <class F> static std::string signatureToString(F serializeTypes) {
  const std::vector<uint32_t> arraySizes;
  std::string result;
  SerializeToString<LittleEndian> s(arraySizes, result);
  serializeTypes(s);
  return result;
}

std::string DBusType::toString() const {
  return signatureToString([this](Serializer &s) { serialize(s); });
}

std::string DBusMessageBody::signature() const {
  return signatureToString([this](Serializer &s) {
    for (size_t i = 0; i < seq_.length(); i++) {
      seq_.getElement(i)->getType().serialize(s);
    }
  });
}

void DBusMessageBody::serialize(Serializer &s) const { seq_.serialize(s); }

size_t DBusMessageBody::serializedSize() const {
  SerializerDryRun s;
  serialize(s);
  return s.getPos();
}

size_t DBusObject::serializedSize() const {
  SerializerDryRun s;
  serialize(s);
  return s.getPos();
}
