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

#include "dbus.hpp"
#include "dbus_random.hpp"
#include "dbus_serialize.hpp"
#include "endianness.hpp"
#include "utils.hpp"
#include <string.h>

template <Endianness endianness>
std::string dbus_object_to_string(const DBusObject &object) {
  std::vector<uint32_t> arraySizes;
  SerializerInitArraySizes s0(arraySizes);
  object.serialize(s0);

  std::string result;
  result.reserve(s0.getPos());
  SerializeToString<endianness> s1(arraySizes, result);
  object.serialize(s1);
  if (result.size() != s0.getPos()) {
    throw Error("Serialized size doesn't match the dry run.");
  }

  // Serializing into a preallocated buffer gives the same bytes.
  std::unique_ptr<char[]> buf(new char[result.size()]);
  SerializeToBuffer<endianness> s2(arraySizes, buf.get());
  object.serialize(s2);
  if (s2.getPos() != result.size() ||
      memcmp(buf.get(), result.data(), result.size()) != 0) {
    throw Error("SerializeToBuffer and SerializeToString don't match.");
  }
  return result;
}

template <Endianness endianness>
std::unique_ptr<DBusObject> parse_dbus_object(const DBusType &t,
                                              const std::string &bytes) {
  class Cont final : public DBusType::ParseObjectCont<endianness> {
    std::unique_ptr<DBusObject> &result_;

  public:
    explicit Cont(std::unique_ptr<DBusObject> &result) : result_(result) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &, std::unique_ptr<DBusObject> &&object) override {
      result_ = std::move(object);
      return ParseStop::mk();
    }
  };

  std::unique_ptr<DBusObject> result;
  Parse p(t.mkObjectParser<endianness>(Parse::State::initialState_,
                                       std::make_unique<Cont>(result)));
  p.parseBuffer(bytes.data(), bytes.size());
  return result;
}

// Serialize `object`, parse the bytes, and serialize the parsed object
// again. The two serializations must be identical. (`DBusObject` has no
// `operator==`, so the bytes are compared instead of the objects.)
template <Endianness endianness>
void check_serialize_and_parse(const DBusType &t, const DBusObject &object) {
  const std::string bytes0 = dbus_object_to_string<endianness>(object);
  std::unique_ptr<DBusObject> parsedObject =
      parse_dbus_object<endianness>(t, bytes0);
  if (parsedObject->getType().toString() != t.toString()) {
    throw Error(_s("Parsed type doesn't match: ") +
                parsedObject->getType().toString());
  }

  const std::string bytes1 = dbus_object_to_string<endianness>(*parsedObject);
  if (bytes0 != bytes1) {
    throw Error("Serialized strings don't match.");
  }
}

// Check that parsing `bytes` as a `sig` value fails.
template <Endianness endianness>
void check_parse_error(const char *sig, const std::string &bytes) {
  DBusTypeStorage typeStorage;
  const auto types = DBusObjectSignature(sig).toTypes(typeStorage);
  if (types.size() != 1) {
    throw Error(_s("Expected a single complete type: ") + sig);
  }
  try {
    parse_dbus_object<endianness>(types[0], bytes);
  } catch (const ParseError &) {
    return;
  }
  throw Error(_s("Parse unexpectedly succeeded for type ") + sig);
}

void check_bad_signature(const char *sig) {
  DBusTypeStorage typeStorage;
  try {
    DBusObjectSignature(sig).toTypes(typeStorage);
  } catch (const ParseError &) {
    return;
  }
  throw Error(_s("Signature unexpectedly accepted: ") + sig);
}

void check_equal(const std::string &actual, const std::string &expected,
                 const char *what) {
  if (actual != expected) {
    throw Error(_s(what) + ": expected " + std::to_string(expected.size()) +
                " bytes, got " + std::to_string(actual.size()));
  }
}

// Fixed byte sequences, to pin down the wire format of each byte order.
void test_known_encodings() {
  check_equal(dbus_object_to_string<LittleEndian>(*DBusObjectUint32::mk(1)),
              std::string("\x01\x00\x00\x00", 4), "uint32 LE");
  check_equal(dbus_object_to_string<BigEndian>(*DBusObjectUint32::mk(1)),
              std::string("\x00\x00\x00\x01", 4), "uint32 BE");
  check_equal(dbus_object_to_string<LittleEndian>(*DBusObjectString::mk("ab")),
              std::string("\x02\x00\x00\x00"
                          "ab\x00",
                          7),
              "string");
  check_equal(
      dbus_object_to_string<LittleEndian>(*DBusObjectSignature::mk("ai")),
      std::string("\x02"
                  "ai\x00",
                  4),
      "signature");

  // A struct is aligned to 8 bytes, so the double starts at offset 8.
  std::unique_ptr<DBusObject> s = DBusObjectStruct::mk(
      _vec<std::unique_ptr<DBusObject>>(DBusObjectChar::mk('x'),
                                        DBusObjectDouble::mk(1.0)));
  if (s->getType().toString() != "(yd)") {
    throw Error("Struct signature");
  }
  const std::string structBytes = dbus_object_to_string<BigEndian>(*s);
  check_equal(structBytes,
              std::string("x\x00\x00\x00\x00\x00\x00\x00"
                          "\x3f\xf0\x00\x00\x00\x00\x00\x00",
                          16),
              "struct (yd)");

  // The array length doesn't count the padding before the first element.
  std::unique_ptr<DBusObject> a =
      DBusObjectArray::mk1(_vec<std::unique_ptr<DBusObject>>(
          DBusObjectUint64::mk(1), DBusObjectUint64::mk(2)));
  const std::string arrayBytes = dbus_object_to_string<LittleEndian>(*a);
  if (arrayBytes.size() != 24 || arrayBytes[0] != 16) {
    throw Error("Array of uint64 has the wrong length prefix");
  }

  // An empty array still pads to the alignment of its element type.
  std::unique_ptr<DBusObject> a0 = DBusObjectArray::mk0(DBusTypeUint64::instance_);
  check_equal(dbus_object_to_string<LittleEndian>(*a0),
              std::string(8, '\0'), "empty array of uint64");
}

void test_parse_errors() {
  // Booleans must be 0 or 1.
  check_parse_error<LittleEndian>("b", std::string("\x02\x00\x00\x00", 4));
  // Missing terminating zero byte.
  check_parse_error<LittleEndian>("s", std::string("\x01\x00\x00\x00"
                                                   "ab",
                                                   6));
  // Zero byte inside a string.
  check_parse_error<LittleEndian>("s", std::string("\x02\x00\x00\x00"
                                                   "a\x00\x00",
                                                   7));
  // Non-zero padding.
  check_parse_error<LittleEndian>("(yu)",
                                  std::string("\x01\x01\x00\x00"
                                              "\x01\x00\x00\x00",
                                              8));
  // Array length which isn't a multiple of the element size.
  check_parse_error<LittleEndian>("ai", std::string("\x03\x00\x00\x00"
                                                    "\x01\x00\x00\x00",
                                                    8));
  // Truncated input.
  check_parse_error<BigEndian>("t", std::string("\x00\x00\x00\x01", 4));

  check_bad_signature("()");
  check_bad_signature("(i");
  check_bad_signature("a");
  check_bad_signature("{s}");
  check_bad_signature("z");
  check_bad_signature(")");
}

void test_cast_error() {
  std::unique_ptr<DBusObject> obj = DBusObjectUint32::mk(7);
  if (obj->as<DBusObjectUint32>().getValue() != 7) {
    throw Error("as<DBusObjectUint32>");
  }
  try {
    obj->as<DBusObjectString>();
  } catch (const ObjectCastError &) {
    return;
  }
  throw Error("as<DBusObjectString> didn't throw");
}

// A cloned type outlives the storage of the original. Leaf types are
// shared, containers are rebuilt.
void test_clone_type() {
  DBusTypeStorage cloneStorage;
  for (size_t i = 0; i < 1000; i++) {
    DBusRandomMersenne r(i, 1000);
    std::string expected;
    const DBusType *clone;
    {
      DBusTypeStorage typeStorage;
      const DBusType &t = randomType(r, typeStorage, 10);
      expected = t.toString();
      clone = &cloneType(cloneStorage, t);
    }
    check_equal(clone->toString(), expected, "cloneType");
  }

  if (&cloneType(cloneStorage, DBusTypeSignature::instance_) !=
      &DBusTypeSignature::instance_) {
    throw Error("cloneType copied a leaf type");
  }

  // An empty array keeps a copy of its element type.
  std::unique_ptr<DBusObject> empty;
  {
    DBusTypeStorage typeStorage;
    const DBusTypeArray &arrayType = typeStorage.allocArray(
        typeStorage.allocStruct(_vec(
            std::cref<DBusType>(DBusTypeUint32::instance_),
            std::cref<DBusType>(DBusTypeVariant::instance_))));
    empty = DBusObjectArray::mk0(arrayType.getBaseType());
  }
  check_equal(empty->getType().toString(), "a(uv)", "empty array type");
  check_equal(dbus_object_to_string<LittleEndian>(*empty),
              std::string("\x00\x00\x00\x00\x00\x00\x00\x00", 8),
              "empty array bytes");
}

void test_random_round_trip() {
  for (size_t i = 0; i < 20000; i++) {
    DBusRandomMersenne r(i, 1000);
    DBusTypeStorage typeStorage;
    const size_t maxdepth = 20;
    const DBusType &t = randomType(r, typeStorage, maxdepth);
    std::unique_ptr<DBusObject> object = randomObject(r, t, maxdepth);
    check_serialize_and_parse<LittleEndian>(t, *object);
    check_serialize_and_parse<BigEndian>(t, *object);
  }
}

int main() {
  test_known_encodings();
  test_parse_errors();
  test_cast_error();
  test_clone_type();
  test_random_round_trip();
  return 0;
}
