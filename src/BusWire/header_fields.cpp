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

#include "header_fields.hpp"
#include "utils.hpp"

static const DBusTypeStruct headerFieldType(
    _vec(std::reference_wrapper<const DBusType>(DBusTypeChar::instance_),
         std::reference_wrapper<const DBusType>(DBusTypeVariant::instance_)));

const DBusTypeArray headerFieldsType(headerFieldType);

// Indexed by field code.
static const HeaderValueKind expectedKinds[] = {
    HDRVAL_CONTAINER, // MSGHDR_INVALID
    HDRVAL_PATH,      // MSGHDR_PATH
    HDRVAL_STRING,    // MSGHDR_INTERFACE
    HDRVAL_STRING,    // MSGHDR_MEMBER
    HDRVAL_STRING,    // MSGHDR_ERROR_NAME
    HDRVAL_UINT32,    // MSGHDR_REPLY_SERIAL
    HDRVAL_STRING,    // MSGHDR_DESTINATION
    HDRVAL_STRING,    // MSGHDR_SENDER
    HDRVAL_SIGNATURE, // MSGHDR_SIGNATURE
    HDRVAL_UINT32,    // MSGHDR_UNIX_FDS
};

// Indexed by message type.
static const std::vector<HeaderFieldName> requiredFields[] = {
    {},                                             // MSGTYPE_INVALID
    {MSGHDR_PATH, MSGHDR_MEMBER},                   // MSGTYPE_METHOD_CALL
    {MSGHDR_REPLY_SERIAL},                          // MSGTYPE_METHOD_RETURN
    {MSGHDR_ERROR_NAME, MSGHDR_REPLY_SERIAL},       // MSGTYPE_ERROR
    {MSGHDR_PATH, MSGHDR_INTERFACE, MSGHDR_MEMBER}, // MSGTYPE_SIGNAL
};

bool isKnownHeaderField(uint8_t code) {
  return MSGHDR_PATH <= code && code <= MSGHDR_UNIX_FDS;
}

HeaderValueKind expectedHeaderKind(HeaderFieldName name) {
  if (!isKnownHeaderField(name)) {
    throw Error(_s("Unknown header field: ") + std::to_string(int(name)));
  }
  return expectedKinds[name];
}

const std::vector<HeaderFieldName> &requiredHeaderFields(MessageType t) {
  if (t > MSGTYPE_SIGNAL) {
    return requiredFields[MSGTYPE_INVALID];
  }
  return requiredFields[t];
}

const char *headerFieldNameString(HeaderFieldName name) {
  switch (name) {
  case MSGHDR_INVALID: return "INVALID";
  case MSGHDR_PATH: return "PATH";
  case MSGHDR_INTERFACE: return "INTERFACE";
  case MSGHDR_MEMBER: return "MEMBER";
  case MSGHDR_ERROR_NAME: return "ERROR_NAME";
  case MSGHDR_REPLY_SERIAL: return "REPLY_SERIAL";
  case MSGHDR_DESTINATION: return "DESTINATION";
  case MSGHDR_SENDER: return "SENDER";
  case MSGHDR_SIGNATURE: return "SIGNATURE";
  case MSGHDR_UNIX_FDS: return "UNIX_FDS";
  default: return "UNKNOWN";
  }
}

const char *messageTypeString(MessageType t) {
  switch (t) {
  case MSGTYPE_INVALID: return "INVALID";
  case MSGTYPE_METHOD_CALL: return "METHOD_CALL";
  case MSGTYPE_METHOD_RETURN: return "METHOD_RETURN";
  case MSGTYPE_ERROR: return "ERROR";
  case MSGTYPE_SIGNAL: return "SIGNAL";
  default: return "UNKNOWN";
  }
}

HeaderValue HeaderValue::byte(uint8_t x) {
  return HeaderValue(HDRVAL_BYTE, x, std::string());
}

HeaderValue HeaderValue::boolean(bool b) {
  return HeaderValue(HDRVAL_BOOLEAN, b, std::string());
}

HeaderValue HeaderValue::int16(int16_t x) {
  return HeaderValue(HDRVAL_INT16, static_cast<uint16_t>(x), std::string());
}

HeaderValue HeaderValue::uint16(uint16_t x) {
  return HeaderValue(HDRVAL_UINT16, x, std::string());
}

HeaderValue HeaderValue::int32(int32_t x) {
  return HeaderValue(HDRVAL_INT32, static_cast<uint32_t>(x), std::string());
}

HeaderValue HeaderValue::uint32(uint32_t x) {
  return HeaderValue(HDRVAL_UINT32, x, std::string());
}

HeaderValue HeaderValue::int64(int64_t x) {
  return HeaderValue(HDRVAL_INT64, static_cast<uint64_t>(x), std::string());
}

HeaderValue HeaderValue::uint64(uint64_t x) {
  return HeaderValue(HDRVAL_UINT64, x, std::string());
}

HeaderValue HeaderValue::dbl(double d) {
  uint64_t bits;
  memcpy(&bits, &d, sizeof(bits));
  return HeaderValue(HDRVAL_DOUBLE, bits, std::string());
}

HeaderValue HeaderValue::unixFD(uint32_t i) {
  return HeaderValue(HDRVAL_UNIX_FD, i, std::string());
}

HeaderValue HeaderValue::string(std::string str) {
  return HeaderValue(HDRVAL_STRING, 0, std::move(str));
}

HeaderValue HeaderValue::path(std::string str) {
  return HeaderValue(HDRVAL_PATH, 0, std::move(str));
}

HeaderValue HeaderValue::signature(std::string str) {
  return HeaderValue(HDRVAL_SIGNATURE, 0, std::move(str));
}

HeaderValue HeaderValue::container(std::string sig) {
  return HeaderValue(HDRVAL_CONTAINER, 0, std::move(sig));
}

void HeaderValue::checkKind(HeaderValueKind expected) const {
  if (kind_ != expected) {
    throw Error(_s("Header value has kind '") + char(kind_) +
                "', expected '" + char(expected) + "'");
  }
}

uint8_t HeaderValue::getByte() const {
  checkKind(HDRVAL_BYTE);
  return static_cast<uint8_t>(bits_);
}

bool HeaderValue::getBoolean() const {
  checkKind(HDRVAL_BOOLEAN);
  return bits_ != 0;
}

int16_t HeaderValue::getInt16() const {
  checkKind(HDRVAL_INT16);
  return static_cast<int16_t>(bits_);
}

uint16_t HeaderValue::getUint16() const {
  checkKind(HDRVAL_UINT16);
  return static_cast<uint16_t>(bits_);
}

int32_t HeaderValue::getInt32() const {
  checkKind(HDRVAL_INT32);
  return static_cast<int32_t>(bits_);
}

uint32_t HeaderValue::getUint32() const {
  checkKind(HDRVAL_UINT32);
  return static_cast<uint32_t>(bits_);
}

int64_t HeaderValue::getInt64() const {
  checkKind(HDRVAL_INT64);
  return static_cast<int64_t>(bits_);
}

uint64_t HeaderValue::getUint64() const {
  checkKind(HDRVAL_UINT64);
  return bits_;
}

double HeaderValue::getDouble() const {
  checkKind(HDRVAL_DOUBLE);
  double d;
  memcpy(&d, &bits_, sizeof(d));
  return d;
}

uint32_t HeaderValue::getUnixFD() const {
  checkKind(HDRVAL_UNIX_FD);
  return static_cast<uint32_t>(bits_);
}

const std::string &HeaderValue::getString() const {
  switch (kind_) {
  case HDRVAL_STRING:
  case HDRVAL_PATH:
  case HDRVAL_SIGNATURE:
  case HDRVAL_CONTAINER:
    return str_;
  default:
    throw Error(_s("Header value of kind '") + char(kind_) +
                "' is not a string");
  }
}

HeaderValue HeaderValue::fromObject(const DBusObject &obj) {
  class Visitor final : public DBusObject::Visitor {
    std::unique_ptr<HeaderValue> result_;

    void set(HeaderValue &&v) {
      result_ = std::make_unique<HeaderValue>(std::move(v));
    }

    void container(const DBusObject &obj) {
      set(HeaderValue::container(obj.getType().toString()));
    }

  public:
    void visit(const DBusObjectChar &obj) override {
      set(byte(static_cast<uint8_t>(obj.getValue())));
    }
    void visit(const DBusObjectBoolean &obj) override {
      set(boolean(obj.getValue()));
    }
    void visit(const DBusObjectUint16 &obj) override {
      set(uint16(obj.getValue()));
    }
    void visit(const DBusObjectInt16 &obj) override {
      set(int16(obj.getValue()));
    }
    void visit(const DBusObjectUint32 &obj) override {
      set(uint32(obj.getValue()));
    }
    void visit(const DBusObjectInt32 &obj) override {
      set(int32(obj.getValue()));
    }
    void visit(const DBusObjectUint64 &obj) override {
      set(uint64(obj.getValue()));
    }
    void visit(const DBusObjectInt64 &obj) override {
      set(int64(obj.getValue()));
    }
    void visit(const DBusObjectDouble &obj) override {
      set(dbl(obj.getValue()));
    }
    void visit(const DBusObjectUnixFD &obj) override {
      set(unixFD(obj.getValue()));
    }
    void visit(const DBusObjectString &obj) override {
      set(string(obj.getValue()));
    }
    void visit(const DBusObjectPath &obj) override {
      set(path(obj.getValue()));
    }
    void visit(const DBusObjectSignature &obj) override {
      set(signature(obj.getValue()));
    }
    void visit(const DBusObjectVariant &obj) override { container(obj); }
    void visit(const DBusObjectDictEntry &obj) override { container(obj); }
    void visit(const DBusObjectArray &obj) override { container(obj); }
    void visit(const DBusObjectStruct &obj) override { container(obj); }

    HeaderValue getResult() { return std::move(*result_); }
  };

  Visitor visitor;
  obj.accept(visitor);
  return visitor.getResult();
}

std::unique_ptr<DBusObject> HeaderValue::toObject() const {
  switch (kind_) {
  case HDRVAL_BYTE:
    return DBusObjectChar::mk(static_cast<char>(bits_));
  case HDRVAL_BOOLEAN:
    return DBusObjectBoolean::mk(bits_ != 0);
  case HDRVAL_INT16:
    return DBusObjectInt16::mk(getInt16());
  case HDRVAL_UINT16:
    return DBusObjectUint16::mk(getUint16());
  case HDRVAL_INT32:
    return DBusObjectInt32::mk(getInt32());
  case HDRVAL_UINT32:
    return DBusObjectUint32::mk(getUint32());
  case HDRVAL_INT64:
    return DBusObjectInt64::mk(getInt64());
  case HDRVAL_UINT64:
    return DBusObjectUint64::mk(getUint64());
  case HDRVAL_DOUBLE:
    return DBusObjectDouble::mk(getDouble());
  case HDRVAL_UNIX_FD:
    return DBusObjectUnixFD::mk(getUnixFD());
  case HDRVAL_STRING:
    return DBusObjectString::mk(str_);
  case HDRVAL_PATH:
    return DBusObjectPath::mk(str_);
  case HDRVAL_SIGNATURE:
    return DBusObjectSignature::mk(str_);
  default:
    throw Error(_s("Cannot serialize a header value of type ") + str_);
  }
}
