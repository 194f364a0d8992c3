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

#include "dbus_random.hpp"
#include "utils.hpp"
#include <algorithm>
#include <assert.h>
#include <limits>

// Longest signature which fits in a signature or variant value.
static const size_t maxSignatureLength = 255;

DBusRandomMersenne::DBusRandomMersenne(std::uint_fast64_t seed, size_t maxsize)
    : gen_(seed), maxsize_(maxsize) {}

char DBusRandomMersenne::randomType(const size_t maxdepth) {
  static const char types[] = {'y', 'b', 'n', 'q', 'i', 'u', 'x', 't', 'd',
                               'h', 's', 'o', 'g', 'v', 'a', '(', '{'};
  if (maxdepth == 0) {
    // Skip the 4 container types (variant, array, struct, dict).
    std::uniform_int_distribution<size_t> dis(0, sizeof(types) - 5);
    return types[dis(gen_)];
  } else {
    std::uniform_int_distribution<size_t> dis(0, sizeof(types) - 1);
    return types[dis(gen_)];
  }
}

size_t DBusRandomMersenne::randomNumFields() {
  const size_t numfields = std::max(size_t(1), std::min(size_t(8), maxsize_));
  maxsize_ -= std::min(numfields, maxsize_);
  std::uniform_int_distribution<size_t> dis(1, numfields);
  return dis(gen_);
}

size_t DBusRandomMersenne::randomArraySize() {
  const size_t numelements = std::min(size_t(8), maxsize_);
  maxsize_ -= numelements;
  std::uniform_int_distribution<size_t> dis(0, numelements);
  return dis(gen_);
}

char DBusRandomMersenne::randomChar() {
  std::uniform_int_distribution<int> dis(std::numeric_limits<char>::min(),
                                         std::numeric_limits<char>::max());
  return static_cast<char>(dis(gen_));
}

bool DBusRandomMersenne::randomBoolean() {
  std::uniform_int_distribution<int> dis(0, 1);
  return dis(gen_);
}

uint16_t DBusRandomMersenne::randomUint16() {
  std::uniform_int_distribution<uint16_t> dis;
  return dis(gen_);
}

uint32_t DBusRandomMersenne::randomUint32() {
  std::uniform_int_distribution<uint32_t> dis;
  return dis(gen_);
}

uint64_t DBusRandomMersenne::randomUint64() { return gen_(); }

double DBusRandomMersenne::randomDouble() {
  std::uniform_int_distribution<int> switchdis(0, 11);
  switch (switchdis(gen_)) {
  case 0:
    return 0.0;
  case 1:
    return 1.0;
  case 2:
    return 2.0;
  case 3:
    return std::numeric_limits<double>::infinity();
  case 4:
    return std::numeric_limits<double>::quiet_NaN();
  case 5:
    return -randomDouble();
  case 6:
    return randomDouble() * randomDouble();
  case 7:
    return randomDouble() / randomDouble();
  default:
    return static_cast<double>(randomUint64());
  }
}

std::string DBusRandomMersenne::randomString() {
  std::uniform_int_distribution<size_t> lendis(0, 32);
  const size_t len = lendis(gen_);
  std::string result;
  result.reserve(len);
  // No NUL characters: they are not allowed inside a string.
  std::uniform_int_distribution<int> chardis(1, 127);
  for (size_t i = 0; i < len; i++) {
    result.push_back(static_cast<char>(chardis(gen_)));
  }
  return result;
}

std::string DBusRandomMersenne::randomPath() {
  static const char chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "abcdefghijklmnopqrstuvwxyz"
                              "0123456789_";
  std::uniform_int_distribution<size_t> numdis(0, 4);
  std::uniform_int_distribution<size_t> lendis(1, 8);
  std::uniform_int_distribution<size_t> chardis(0, sizeof(chars) - 2);
  const size_t numElements = numdis(gen_);
  if (numElements == 0) {
    return "/";
  }
  std::string result;
  for (size_t i = 0; i < numElements; i++) {
    result.push_back('/');
    const size_t len = lendis(gen_);
    for (size_t j = 0; j < len; j++) {
      result.push_back(chars[chardis(gen_)]);
    }
  }
  return result;
}

static const DBusTypeStruct &
randomStructType(DBusRandom &r,
                 DBusTypeStorage &typeStorage, // Type allocator
                 const size_t maxdepth) {
  std::vector<std::reference_wrapper<const DBusType>> fieldTypes;
  const size_t numFields = r.randomNumFields();
  fieldTypes.reserve(numFields);
  for (size_t i = 0; i < numFields; i++) {
    fieldTypes.push_back(randomType(r, typeStorage, maxdepth));
  }
  return typeStorage.allocStruct(std::move(fieldTypes));
}

const DBusType &randomType(DBusRandom &r,
                           DBusTypeStorage &typeStorage, // Type allocator
                           const size_t maxdepth) {
  switch (r.randomType(maxdepth)) {
  case 'y':
    return DBusTypeChar::instance_;
  case 'b':
    return DBusTypeBoolean::instance_;
  case 'q':
    return DBusTypeUint16::instance_;
  case 'n':
    return DBusTypeInt16::instance_;
  case 'u':
    return DBusTypeUint32::instance_;
  case 'i':
    return DBusTypeInt32::instance_;
  case 't':
    return DBusTypeUint64::instance_;
  case 'x':
    return DBusTypeInt64::instance_;
  case 'd':
    return DBusTypeDouble::instance_;
  case 'h':
    return DBusTypeUnixFD::instance_;
  case 's':
    return DBusTypeString::instance_;
  case 'o':
    return DBusTypePath::instance_;
  case 'g':
    return DBusTypeSignature::instance_;
  case 'v':
    return DBusTypeVariant::instance_;
  case 'a':
    if (maxdepth == 0) {
      break;
    }
    return typeStorage.allocArray(randomType(r, typeStorage, maxdepth - 1));
  case '(':
    if (maxdepth == 0) {
      break;
    }
    return randomStructType(r, typeStorage, maxdepth - 1);
  case '{':
    if (maxdepth == 0) {
      break;
    }
    return typeStorage.allocDictEntry(
        randomType(r, typeStorage, 0), // key is required to be a basic type
        randomType(r, typeStorage, maxdepth - 1));
  default:
    break;
  }
  throw Error("Bad type in randomType.");
}

// Generate a random type whose signature fits in a signature value. Falls
// back to a basic type if the random type is too big.
static const DBusType &randomSmallType(DBusRandom &r,
                                       DBusTypeStorage &typeStorage,
                                       const size_t maxdepth) {
  const DBusType &t = randomType(r, typeStorage, maxdepth);
  if (t.toString().size() <= maxSignatureLength) {
    return t;
  }
  return randomType(r, typeStorage, 0);
}

std::unique_ptr<DBusObject> randomObject(DBusRandom &r, const DBusType &t,
                                         const size_t maxdepth) {
  class Visitor final : public DBusType::Visitor {
    DBusRandom &r_;
    const size_t maxdepth_;
    std::unique_ptr<DBusObject> result_;

    size_t newdepth() const { return maxdepth_ > 0 ? maxdepth_ - 1 : 0; }

  public:
    Visitor(DBusRandom &r, const size_t maxdepth)
        : r_(r), maxdepth_(maxdepth) {}

    void visit(const DBusTypeChar &) override {
      result_ = DBusObjectChar::mk(r_.randomChar());
    }

    void visit(const DBusTypeBoolean &) override {
      result_ = DBusObjectBoolean::mk(r_.randomBoolean());
    }

    void visit(const DBusTypeUint16 &) override {
      result_ = DBusObjectUint16::mk(r_.randomUint16());
    }

    void visit(const DBusTypeInt16 &) override {
      result_ = DBusObjectInt16::mk(static_cast<int16_t>(r_.randomUint16()));
    }

    void visit(const DBusTypeUint32 &) override {
      result_ = DBusObjectUint32::mk(r_.randomUint32());
    }

    void visit(const DBusTypeInt32 &) override {
      result_ = DBusObjectInt32::mk(static_cast<int32_t>(r_.randomUint32()));
    }

    void visit(const DBusTypeUint64 &) override {
      result_ = DBusObjectUint64::mk(r_.randomUint64());
    }

    void visit(const DBusTypeInt64 &) override {
      result_ = DBusObjectInt64::mk(static_cast<int64_t>(r_.randomUint64()));
    }

    void visit(const DBusTypeDouble &) override {
      result_ = DBusObjectDouble::mk(r_.randomDouble());
    }

    void visit(const DBusTypeUnixFD &) override {
      result_ = DBusObjectUnixFD::mk(r_.randomUint32());
    }

    void visit(const DBusTypeString &) override {
      result_ = DBusObjectString::mk(r_.randomString());
    }

    void visit(const DBusTypePath &) override {
      result_ = DBusObjectPath::mk(r_.randomPath());
    }

    void visit(const DBusTypeSignature &) override {
      DBusTypeStorage typeStorage;
      const DBusType &t = randomSmallType(r_, typeStorage, maxdepth_);
      result_ = DBusObjectSignature::mk(t.toString());
    }

    void visit(const DBusTypeVariant &) override {
      DBusTypeStorage typeStorage;
      const DBusType &t = randomSmallType(r_, typeStorage, newdepth());
      result_ = DBusObjectVariant::mk(randomObject(r_, t, newdepth()));
    }

    void visit(const DBusTypeDictEntry &dictType) override {
      result_ = DBusObjectDictEntry::mk(
          randomObject(r_, dictType.getKeyType(), 0),
          randomObject(r_, dictType.getValueType(), newdepth()));
    }

    void visit(const DBusTypeArray &arrayType) override {
      const DBusType &baseType = arrayType.getBaseType();
      const size_t n = r_.randomArraySize();
      std::vector<std::unique_ptr<DBusObject>> elements;
      elements.reserve(n);
      for (size_t i = 0; i < n; i++) {
        elements.push_back(randomObject(r_, baseType, newdepth()));
      }
      result_ = DBusObjectArray::mk(baseType, std::move(elements));
    }

    void visit(const DBusTypeStruct &structType) override {
      const std::vector<std::reference_wrapper<const DBusType>> &fieldTypes =
          structType.getFieldTypes();
      std::vector<std::unique_ptr<DBusObject>> elements;
      elements.reserve(fieldTypes.size());
      for (const DBusType &fieldType : fieldTypes) {
        elements.push_back(randomObject(r_, fieldType, newdepth()));
      }
      result_ = DBusObjectStruct::mk(std::move(elements));
    }

    std::unique_ptr<DBusObject> getResult() { return std::move(result_); }
  };

  Visitor v(r, maxdepth);
  t.accept(v);
  return v.getResult();
}

// A random dotted name, like "org.example.Foo", for interfaces, error
// names and bus names.
static std::string randomDottedName(DBusRandom &r) {
  std::string path = r.randomPath();
  if (path == "/") {
    return "a.b";
  }
  std::replace(path.begin(), path.end(), '/', '.');
  return "x" + path;
}

HeaderValue randomHeaderValue(DBusRandom &r, HeaderFieldName name) {
  switch (name) {
  case MSGHDR_PATH:
    return HeaderValue::path(r.randomPath());
  case MSGHDR_INTERFACE:
  case MSGHDR_ERROR_NAME:
  case MSGHDR_DESTINATION:
  case MSGHDR_SENDER:
    return HeaderValue::string(randomDottedName(r));
  case MSGHDR_MEMBER:
    return HeaderValue::string("M" + std::to_string(r.randomUint16()));
  case MSGHDR_REPLY_SERIAL:
    return HeaderValue::uint32(r.randomUint32() | 1);
  case MSGHDR_SIGNATURE: {
    DBusTypeStorage typeStorage;
    return HeaderValue::signature(
        randomSmallType(r, typeStorage, 2).toString());
  }
  case MSGHDR_UNIX_FDS:
    return HeaderValue::uint32(r.randomUint16() % 16);
  default:
    throw Error(_s("randomHeaderValue: unknown header field ") +
                std::to_string(name));
  }
}

std::unique_ptr<Message> randomMessage(DBusRandom &r, const size_t maxdepth) {
  static const MessageType types[] = {MSGTYPE_METHOD_CALL,
                                      MSGTYPE_METHOD_RETURN, MSGTYPE_ERROR,
                                      MSGTYPE_SIGNAL};
  static const HeaderFieldName optionalFields[] = {
      MSGHDR_DESTINATION, MSGHDR_SENDER, MSGHDR_UNIX_FDS};

  const Endianness endianness = r.randomBoolean() ? LittleEndian : BigEndian;
  const MessageType messageType = types[r.randomUint16() % 4];
  const MessageFlags flags =
      static_cast<MessageFlags>(r.randomChar() & MSGFLAGS_VALID_MASK);
  auto message = std::make_unique<Message>(endianness, messageType, flags,
                                           r.randomUint32() | 1);

  for (HeaderFieldName name : requiredHeaderFields(messageType)) {
    message->setHeader(name, randomHeaderValue(r, name));
  }
  for (HeaderFieldName name : optionalFields) {
    if (r.randomBoolean()) {
      message->setHeader(name, randomHeaderValue(r, name));
    }
  }
  // Interface is optional for a method call.
  if (messageType == MSGTYPE_METHOD_CALL && r.randomBoolean()) {
    message->setHeader(MSGHDR_INTERFACE,
                       randomHeaderValue(r, MSGHDR_INTERFACE));
  }

  // The body is a sequence of random values, with a signature that fits
  // in the signature header.
  std::vector<std::unique_ptr<DBusObject>> elements;
  std::string signature;
  const size_t numElements = r.randomUint16() % 4;
  for (size_t i = 0; i < numElements; i++) {
    DBusTypeStorage typeStorage;
    const DBusType &t = randomSmallType(r, typeStorage, maxdepth);
    const std::string sig = t.toString();
    if (signature.size() + sig.size() > maxSignatureLength) {
      break;
    }
    signature += sig;
    elements.push_back(randomObject(r, t, maxdepth));
  }
  message->setBody(*DBusMessageBody::mk(std::move(elements)));
  return message;
}
