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
#include <vector>

// The message types, flags and header field codes of the D-Bus message
// header. The enums have a fixed underlying type because their values
// are read straight off the wire, so they can hold bytes which are not
// one of the enumerators.
// https://dbus.freedesktop.org/doc/dbus-specification.html#message-protocol-messages

enum MessageType : uint8_t {
  MSGTYPE_INVALID = 0,
  MSGTYPE_METHOD_CALL = 1,
  MSGTYPE_METHOD_RETURN = 2,
  MSGTYPE_ERROR = 3,
  MSGTYPE_SIGNAL = 4
};

enum MessageFlags : uint8_t {
  MSGFLAGS_EMPTY = 0x0,
  MSGFLAGS_NO_REPLY_EXPECTED = 0x1,
  MSGFLAGS_NO_AUTO_START = 0x2
};

// Every flag bit that a valid message may set.
const uint8_t MSGFLAGS_VALID_MASK =
  MSGFLAGS_NO_REPLY_EXPECTED | MSGFLAGS_NO_AUTO_START;

enum HeaderFieldName : uint8_t {
  MSGHDR_INVALID = 0,
  MSGHDR_PATH = 1,
  MSGHDR_INTERFACE = 2,
  MSGHDR_MEMBER = 3,
  MSGHDR_ERROR_NAME = 4,
  MSGHDR_REPLY_SERIAL = 5,
  MSGHDR_DESTINATION = 6,
  MSGHDR_SENDER = 7,
  MSGHDR_SIGNATURE = 8,
  MSGHDR_UNIX_FDS = 9
};

// The kind of a header value. The enumerators of the basic types are
// their signature characters. A decoded header can also contain a
// container value, like an array, which never matches the registry.
enum HeaderValueKind : char {
  HDRVAL_BYTE = DBusTypeChar::signatureChar,
  HDRVAL_BOOLEAN = DBusTypeBoolean::signatureChar,
  HDRVAL_INT16 = DBusTypeInt16::signatureChar,
  HDRVAL_UINT16 = DBusTypeUint16::signatureChar,
  HDRVAL_INT32 = DBusTypeInt32::signatureChar,
  HDRVAL_UINT32 = DBusTypeUint32::signatureChar,
  HDRVAL_INT64 = DBusTypeInt64::signatureChar,
  HDRVAL_UINT64 = DBusTypeUint64::signatureChar,
  HDRVAL_DOUBLE = DBusTypeDouble::signatureChar,
  HDRVAL_UNIX_FD = DBusTypeUnixFD::signatureChar,
  HDRVAL_STRING = DBusTypeString::signatureChar,
  HDRVAL_PATH = DBusTypePath::signatureChar,
  HDRVAL_SIGNATURE = DBusTypeSignature::signatureChar,
  HDRVAL_CONTAINER = '*'
};

// The value of a header field, tagged with its kind. Integers, booleans
// and doubles are stored in `bits_`. Strings, paths and signatures are
// stored in `str_`. For a container value, `str_` holds its signature.
class HeaderValue final {
  HeaderValueKind kind_;
  uint64_t bits_;
  std::string str_;

  HeaderValue(HeaderValueKind kind, uint64_t bits, std::string&& str) :
    kind_(kind), bits_(bits), str_(std::move(str))
  {}

  // Throws `Error` if the kind is not `expected`.
  void checkKind(HeaderValueKind expected) const;

public:
  static HeaderValue byte(uint8_t x);
  static HeaderValue boolean(bool b);
  static HeaderValue int16(int16_t x);
  static HeaderValue uint16(uint16_t x);
  static HeaderValue int32(int32_t x);
  static HeaderValue uint32(uint32_t x);
  static HeaderValue int64(int64_t x);
  static HeaderValue uint64(uint64_t x);
  static HeaderValue dbl(double d);
  static HeaderValue unixFD(uint32_t i);
  static HeaderValue string(std::string str);
  static HeaderValue path(std::string str);
  static HeaderValue signature(std::string str);
  static HeaderValue container(std::string sig);

  // Convert the value of a decoded header variant.
  static HeaderValue fromObject(const DBusObject& obj);

  // Convert to a codec object, for serializing. Throws `Error` for a
  // container value, because only its signature is kept.
  std::unique_ptr<DBusObject> toObject() const;

  HeaderValueKind getKind() const { return kind_; }

  uint8_t getByte() const;
  bool getBoolean() const;
  int16_t getInt16() const;
  uint16_t getUint16() const;
  int32_t getInt32() const;
  uint32_t getUint32() const;
  int64_t getInt64() const;
  uint64_t getUint64() const;
  double getDouble() const;
  uint32_t getUnixFD() const;

  // The string of a string, path or signature value, or the signature
  // of a container value.
  const std::string& getString() const;

  void print(Printer& p, size_t indent) const;

  bool operator==(const HeaderValue& other) const {
    return kind_ == other.kind_ && bits_ == other.bits_ && str_ == other.str_;
  }

  bool operator!=(const HeaderValue& other) const {
    return !(*this == other);
  }
};

// Header field registry. These lookups read constant tables, so they are
// safe to call from any thread.

// True for the field codes 1-9.
bool isKnownHeaderField(uint8_t code);

// The kind of value which a known header field must have. Throws `Error`
// for an unknown field.
HeaderValueKind expectedHeaderKind(HeaderFieldName name);

// The header fields which must be present in a message of type `t`.
// Empty for an unknown message type.
const std::vector<HeaderFieldName>& requiredHeaderFields(MessageType t);

const char* headerFieldNameString(HeaderFieldName name);

const char* messageTypeString(MessageType t);

// The type of the header fields array: `a(yv)`.
extern const DBusTypeArray headerFieldsType;
