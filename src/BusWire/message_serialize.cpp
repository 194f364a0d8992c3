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
#include "message.hpp"
#include "utils.hpp"

// Build the `a(yv)` header fields array, in ascending field code order.
static std::unique_ptr<DBusObjectArray>
headerFieldsToObject(const std::map<HeaderFieldName, HeaderValue> &headers) {
  std::vector<std::unique_ptr<DBusObject>> fields;
  fields.reserve(headers.size());
  for (const auto &header : headers) {
    fields.push_back(DBusObjectStruct::mk(
        _vec(_obj(DBusObjectChar::mk(header.first)),
             _obj(DBusObjectVariant::mk(header.second.toObject())))));
  }
  return DBusObjectArray::mk(headerFieldsType.getBaseType(), std::move(fields));
}

void Message::serialize(Serializer &s) const {
  s.writeByte(endianness_);
  s.writeByte(messageType_);
  s.writeByte(flags_);
  s.writeByte(DBUS_MAJOR_PROTOCOL_VERSION);
  s.writeUint32(body_.size());
  s.writeUint32(serial_);
  headerFieldsToObject(headers_)->serialize(s);
  s.insertPadding(sizeof(uint64_t));
  s.writeBytes(body_.data(), body_.size());
}

template <Endianness endianness>
static std::string messageToBytes(const Message &message) {
  std::vector<uint32_t> arraySizes;
  SerializerInitArraySizes s0(arraySizes);
  message.serialize(s0);

  std::string result;
  result.reserve(s0.getPos());
  SerializeToString<endianness> s1(arraySizes, result);
  message.serialize(s1);
  return result;
}

std::string Message::toBytes() const {
  validate();
  if (endianness_ == BigEndian) {
    return messageToBytes<BigEndian>(*this);
  } else {
    return messageToBytes<LittleEndian>(*this);
  }
}

void sendMessage(ByteSink &sink, const Message &message) {
  const std::string bytes = message.toBytes();
  sink.writeBytes(bytes.data(), bytes.size());
}
