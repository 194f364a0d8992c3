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
#include "dbus_serialize.hpp"
#include "endianness.hpp"
#include "message.hpp"
#include "utils.hpp"
#include <functional>

// Encode without validating, to produce bytes which a correct sender
// would never write.
template <Endianness endianness>
std::string unchecked_message_bytes(const Message &message) {
  std::vector<uint32_t> arraySizes;
  SerializerInitArraySizes s0(arraySizes);
  message.serialize(s0);
  std::string result;
  SerializeToString<endianness> s1(arraySizes, result);
  message.serialize(s1);
  return result;
}

std::unique_ptr<Message> decode(const std::string &bytes) {
  ByteSourceBuffer source(bytes);
  std::unique_ptr<Message> message = receiveMessage(source);
  if (source.remaining() != 0) {
    throw Error("receiveMessage didn't consume the whole message");
  }
  return message;
}

void check(bool ok, const char *what) {
  if (!ok) {
    throw Error(_s("Check failed: ") + what);
  }
}

void expect_invalid(InvalidMessageKind kind, uint8_t field,
                    const std::function<void()> &f, const char *what) {
  try {
    f();
  } catch (const InvalidMessageError &e) {
    if (e.getKind() != kind) {
      throw Error(_s(what) + ": wrong error kind " +
                  std::to_string(int(e.getKind())) + ": " + e.what());
    }
    if (e.getField() != field) {
      throw Error(_s(what) + ": wrong header field " +
                  std::to_string(int(e.getField())));
    }
    return;
  }
  throw Error(_s(what) + ": no InvalidMessageError");
}

std::unique_ptr<Message> mk_method_call() {
  auto message = std::make_unique<Message>(LittleEndian, MSGTYPE_METHOD_CALL,
                                           MSGFLAGS_EMPTY, 1);
  message->setHeader(MSGHDR_PATH, HeaderValue::path("/org/x"));
  message->setHeader(MSGHDR_MEMBER, HeaderValue::string("Foo"));
  return message;
}

// A method call with an empty body and no signature round trips.
void test_method_call_round_trip() {
  std::unique_ptr<Message> message = mk_method_call();
  message->validate();
  std::unique_ptr<Message> decoded = decode(message->toBytes());
  check(!decoded->hasHeader(MSGHDR_SENDER), "no sender");
  check(decoded->getEndianness() == LittleEndian, "byte order");
  check(decoded->getMessageType() == MSGTYPE_METHOD_CALL, "message type");
  check(decoded->getSerial() == 1, "serial");
  check(decoded->getHeaders().size() == 2, "number of headers");
  check(decoded->getHeader(MSGHDR_PATH) == HeaderValue::path("/org/x"),
        "path header");
  check(decoded->getHeader(MSGHDR_MEMBER) == HeaderValue::string("Foo"),
        "member header");
  check(decoded->getBody().empty(), "empty body");
}

void test_header_values() {
  const HeaderValue v = HeaderValue::uint32(5);
  check(v.getKind() == HDRVAL_UINT32 && v.getUint32() == 5, "uint32 value");
  check(v != HeaderValue::unixFD(5), "kinds are compared");
  bool threw = false;
  try {
    v.getString();
  } catch (const Error &) {
    threw = true;
  }
  check(threw, "getString on a uint32 value");

  // Every basic kind survives a trip through the codec objects.
  const HeaderValue values[] = {
      HeaderValue::byte(0xff),         HeaderValue::boolean(true),
      HeaderValue::int16(-2),          HeaderValue::uint16(0xfffe),
      HeaderValue::int32(-3),          HeaderValue::uint32(0xfffffffd),
      HeaderValue::int64(-4),          HeaderValue::uint64(1ull << 63),
      HeaderValue::dbl(0.5),           HeaderValue::unixFD(3),
      HeaderValue::string("s"),        HeaderValue::path("/p"),
      HeaderValue::signature("a{sv}"),
  };
  for (const HeaderValue &value : values) {
    check(HeaderValue::fromObject(*value.toObject()) == value,
          "header value conversion");
  }
  check(HeaderValue::fromObject(*values[0].toObject()).getByte() == 0xff,
        "byte");
  check(values[1].getBoolean(), "boolean");
  check(values[2].getInt16() == -2, "int16");
  check(values[3].getUint16() == 0xfffe, "uint16");
  check(values[4].getInt32() == -3, "int32");
  check(values[6].getInt64() == -4, "int64");
  check(values[7].getUint64() == 1ull << 63, "uint64");
  check(values[8].getDouble() == 0.5, "double");
  check(values[9].getUnixFD() == 3, "unix fd");
}

void test_missing_member() {
  std::unique_ptr<Message> message = mk_method_call();
  message->eraseHeader(MSGHDR_MEMBER);
  expect_invalid(MISSING_REQUIRED_HEADER, MSGHDR_MEMBER,
                 [&]() { message->validate(); }, "missing member");

  // Nothing is written for an invalid message.
  ByteSinkBuffer sink;
  expect_invalid(MISSING_REQUIRED_HEADER, MSGHDR_MEMBER,
                 [&]() { sendMessage(sink, *message); }, "send missing member");
  check(sink.getNumWrites() == 0, "no write for an invalid message");
}

void test_bad_byte_order() {
  ByteSourceBuffer source(_s("A"));
  expect_invalid(INVALID_BYTE_ORDER, 0, [&]() { receiveMessage(source); },
                 "byte order 'A'");
  check(source.bytesRead() == 1, "stops after the byte-order marker");
}

void test_required_fields() {
  struct {
    MessageType type;
    std::vector<HeaderFieldName> fields;
  } cases[] = {
      {MSGTYPE_METHOD_CALL, {MSGHDR_PATH, MSGHDR_MEMBER}},
      {MSGTYPE_METHOD_RETURN, {MSGHDR_REPLY_SERIAL}},
      {MSGTYPE_ERROR, {MSGHDR_ERROR_NAME, MSGHDR_REPLY_SERIAL}},
      {MSGTYPE_SIGNAL, {MSGHDR_PATH, MSGHDR_INTERFACE, MSGHDR_MEMBER}},
  };
  DBusRandomMersenne r(0, 100);
  for (const auto &c : cases) {
    check(requiredHeaderFields(c.type) == c.fields, "required field table");
    Message message(LittleEndian, c.type, MSGFLAGS_EMPTY, 7);
    for (HeaderFieldName name : c.fields) {
      message.setHeader(name, randomHeaderValue(r, name));
    }
    message.validate();
    for (HeaderFieldName name : c.fields) {
      Message missing(message);
      missing.eraseHeader(name);
      expect_invalid(MISSING_REQUIRED_HEADER, name,
                     [&]() { missing.validate(); }, "required field");
    }
  }
}

void test_header_checks() {
  // Unknown header field codes are rejected, in ascending code order.
  std::unique_ptr<Message> message = mk_method_call();
  message->setHeader(HeaderFieldName(42), HeaderValue::string("x"));
  message->setHeader(HeaderFieldName(10), HeaderValue::uint32(1));
  expect_invalid(INVALID_HEADER_FIELD, 10, [&]() { message->validate(); },
                 "unknown header field");

  // The same check runs on the decode path.
  expect_invalid(INVALID_HEADER_FIELD, 10,
                 [&]() {
                   decode(unchecked_message_bytes<LittleEndian>(*message));
                 },
                 "decode unknown header field");

  std::unique_ptr<Message> mismatch = mk_method_call();
  mismatch->setHeader(MSGHDR_PATH, HeaderValue::string("/org/x"));
  expect_invalid(HEADER_TYPE_MISMATCH, MSGHDR_PATH,
                 [&]() { mismatch->validate(); }, "path as a string");

  // A type mismatch is found before a missing required field.
  mismatch->eraseHeader(MSGHDR_MEMBER);
  expect_invalid(HEADER_TYPE_MISMATCH, MSGHDR_PATH,
                 [&]() { mismatch->validate(); }, "mismatch before missing");

  // Container values never match the registry.
  std::unique_ptr<Message> container = mk_method_call();
  container->setHeader(
      MSGHDR_DESTINATION,
      HeaderValue::fromObject(*DBusObjectArray::mk1(
          _vec<std::unique_ptr<DBusObject>>(DBusObjectString::mk("a")))));
  check(container->getHeader(MSGHDR_DESTINATION).getKind() == HDRVAL_CONTAINER,
        "container kind");
  check(container->getHeader(MSGHDR_DESTINATION).getString() == "as",
        "container signature");
  expect_invalid(HEADER_TYPE_MISMATCH, MSGHDR_DESTINATION,
                 [&]() { container->validate(); }, "container header");
}

// Messages which break the protocol are rejected when they are decoded,
// with the same error as `validate`.
void test_decode_invalid() {
  std::unique_ptr<Message> noMember = mk_method_call();
  noMember->eraseHeader(MSGHDR_MEMBER);
  expect_invalid(MISSING_REQUIRED_HEADER, MSGHDR_MEMBER,
                 [&]() {
                   decode(unchecked_message_bytes<LittleEndian>(*noMember));
                 },
                 "decode missing member");

  std::unique_ptr<Message> badFlags = mk_method_call();
  badFlags->setFlags(MessageFlags(0x4));
  expect_invalid(INVALID_FLAGS, 0,
                 [&]() {
                   decode(unchecked_message_bytes<LittleEndian>(*badFlags));
                 },
                 "decode flags 0x4");

  std::unique_ptr<Message> badType = mk_method_call();
  badType->setMessageType(MessageType(5));
  expect_invalid(INVALID_MESSAGE_TYPE, 0,
                 [&]() {
                   decode(unchecked_message_bytes<LittleEndian>(*badType));
                 },
                 "decode type 5");

  std::unique_ptr<Message> noSignature = mk_method_call();
  noSignature->setRawBody(std::string("\x01\x00\x00\x00", 4));
  expect_invalid(MISSING_SIGNATURE, MSGHDR_SIGNATURE,
                 [&]() {
                   decode(unchecked_message_bytes<LittleEndian>(*noSignature));
                 },
                 "decode body without signature");

  // The whole message is read before it is rejected, so the next one
  // can still be decoded.
  ByteSourceBuffer source(unchecked_message_bytes<LittleEndian>(*badFlags) +
                          mk_method_call()->toBytes());
  expect_invalid(INVALID_FLAGS, 0, [&]() { receiveMessage(source); },
                 "first message of two");
  check(receiveMessage(source)->getSerial() == 1, "second message");
}

void test_flags_and_type() {
  std::unique_ptr<Message> message = mk_method_call();
  message->setFlags(MessageFlags(MSGFLAGS_NO_REPLY_EXPECTED |
                                 MSGFLAGS_NO_AUTO_START));
  message->validate();

  // Flags are checked before the message type.
  message->setFlags(MessageFlags(0x4));
  message->setMessageType(MessageType(5));
  expect_invalid(INVALID_FLAGS, 0, [&]() { message->validate(); }, "flags");

  message->setFlags(MSGFLAGS_EMPTY);
  expect_invalid(INVALID_MESSAGE_TYPE, 0, [&]() { message->validate(); },
                 "type 5");
  message->setMessageType(MSGTYPE_INVALID);
  expect_invalid(INVALID_MESSAGE_TYPE, 0, [&]() { message->validate(); },
                 "type 0");
}

void test_signature_required() {
  std::unique_ptr<Message> message = mk_method_call();
  message->setRawBody(std::string("\x01\x00\x00\x00", 4));
  expect_invalid(MISSING_SIGNATURE, MSGHDR_SIGNATURE,
                 [&]() { message->validate(); }, "body without signature");

  message->setHeader(MSGHDR_SIGNATURE, HeaderValue::signature("u"));
  message->validate();
  std::unique_ptr<DBusMessageBody> body = decode(message->toBytes())->parseBody();
  check(body->numElements() == 1, "one body element");
  check(body->getElement(0)->as<DBusObjectUint32>().getValue() == 1,
        "body value");
}

void test_alignment() {
  // Header lengths of every residue modulo 8 must all be padded.
  for (size_t len = 1; len <= 16; len++) {
    std::unique_ptr<Message> message = mk_method_call();
    message->setHeader(MSGHDR_PATH, HeaderValue::path("/" + std::string(len, 'p')));
    message->setBody(*DBusMessageBody::mk1(DBusObjectUint64::mk(len)));
    const std::string bytes = message->toBytes();

    const uint32_t bodyLen = readUint<LittleEndian, uint32_t>(&bytes[4]);
    const uint32_t arrayLen = readUint<LittleEndian, uint32_t>(&bytes[12]);
    const size_t headerEnd = 16 + arrayLen;
    const size_t bodyStart = bytes.size() - bodyLen;
    check(bodyLen == 8, "body length field");
    check(bodyStart % 8 == 0, "body starts on an 8-byte boundary");
    check(bodyStart >= headerEnd && bodyStart - headerEnd < 8,
          "padding is shorter than 8 bytes");
    for (size_t i = headerEnd; i < bodyStart; i++) {
      check(bytes[i] == '\0', "padding is zero");
    }
  }
}

void test_big_endian() {
  std::unique_ptr<Message> message =
      Message::methodCall(0x01020304, "org.example", "/org/example",
                          "org.example.Iface", "Ping",
                          *DBusMessageBody::mk1(DBusObjectUint32::mk(0x0a0b0c0d)),
                          MSGFLAGS_EMPTY, BigEndian);
  message->setHeader(MSGHDR_SENDER, HeaderValue::string(":1.5"));
  const std::string bytes = message->toBytes();
  check(bytes[0] == 'B', "big-endian marker");
  check(bytes.substr(8, 4) == std::string("\x01\x02\x03\x04", 4),
        "big-endian serial");
  check(bytes.substr(bytes.size() - 4) == std::string("\x0a\x0b\x0c\x0d", 4),
        "big-endian body");

  std::unique_ptr<Message> decoded = decode(bytes);
  check(decoded->getEndianness() == BigEndian, "decoded byte order");
  check(decoded->getSerial() == 0x01020304, "decoded serial");
  check(decoded->getInterface() == "org.example.Iface", "decoded interface");
  check(decoded->getSender() == ":1.5", "decoded sender");
  check(decoded->parseBody()->getElement(0)->as<DBusObjectUint32>().getValue() ==
            0x0a0b0c0d,
        "decoded body");
  check(decoded->toBytes() == bytes, "re-encoded bytes");
}

void test_set_body() {
  std::unique_ptr<Message> message = mk_method_call();
  message->setBody(*DBusMessageBody::mk(_vec<std::unique_ptr<DBusObject>>(
      DBusObjectString::mk("hello"), DBusObjectBoolean::mk(true),
      DBusObjectVariant::mk(DBusObjectDouble::mk(2.5)))));
  check(message->getSignature() == "sbv", "signature header");

  std::unique_ptr<DBusMessageBody> body = message->parseBody();
  check(body->signature() == "sbv", "parsed signature");
  check(body->getElement(0)->as<DBusObjectString>().getValue() == "hello",
        "string argument");
  check(body->getElement(1)->as<DBusObjectBoolean>().getValue(),
        "boolean argument");
  const DBusObjectVariant &v = body->getElement(2)->as<DBusObjectVariant>();
  check(v.getValue()->as<DBusObjectDouble>().getValue() == 2.5,
        "variant argument");

  // An empty body removes the signature.
  message->setBody(*DBusMessageBody::mk0());
  check(!message->hasHeader(MSGHDR_SIGNATURE), "signature removed");
  check(message->getBody().empty(), "body cleared");
}

void test_protocol_version() {
  std::string bytes = mk_method_call()->toBytes();
  bytes[3] = 2;
  expect_invalid(INVALID_PROTOCOL_VERSION, 0, [&]() { decode(bytes); },
                 "version 2");
}

void test_truncated() {
  const std::string bytes = mk_method_call()->toBytes();
  for (size_t n = 0; n < bytes.size(); n++) {
    ByteSourceBuffer source(bytes.substr(0, n));
    try {
      receiveMessage(source);
    } catch (const EndOfStreamError &) {
      continue;
    }
    throw Error(_s("Truncated message accepted, length ") + std::to_string(n));
  }
}

void test_single_write() {
  ByteSinkBuffer sink;
  std::unique_ptr<Message> message =
      Message::signal(3, "/org/x", "org.x.Iface", "Changed",
                      *DBusMessageBody::mk1(DBusObjectString::mk("v")));
  sendMessage(sink, *message);
  check(sink.getNumWrites() == 1, "single write");
  check(sink.getBytes() == message->toBytes(), "written bytes");
}

void test_stream_of_messages() {
  std::string bytes;
  for (uint32_t serial = 1; serial <= 3; serial++) {
    std::unique_ptr<Message> message = mk_method_call();
    message->setSerial(serial);
    bytes += message->toBytes();
  }
  ByteSourceBuffer source(bytes);
  for (uint32_t serial = 1; serial <= 3; serial++) {
    check(receiveMessage(source)->getSerial() == serial, "message order");
  }
  check(source.remaining() == 0, "all bytes consumed");
}

std::string three_messages() {
  std::string bytes;
  for (uint32_t serial = 1; serial <= 3; serial++) {
    std::unique_ptr<Message> message = mk_method_call();
    message->setSerial(serial);
    bytes += message->toBytes();
  }
  return bytes;
}

void test_receive_messages() {
  // The stream ends cleanly after the third message.
  {
    ByteSourceBuffer source(three_messages());
    std::vector<uint32_t> serials;
    const size_t n = receiveMessages(source, 0, [&](const Message &m) {
      serials.push_back(m.getSerial());
    });
    check(n == 3, "three messages");
    check(serials == std::vector<uint32_t>({1, 2, 3}), "serials in order");
  }

  // Stop after two messages.
  {
    const std::string bytes = three_messages();
    ByteSourceBuffer source(bytes);
    const size_t n = receiveMessages(source, 2, [](const Message &) {});
    check(n == 2, "limit of two messages");
    check(source.remaining() == bytes.size() / 3, "third message unread");
  }

  // An empty stream has no messages.
  {
    ByteSourceBuffer source(_s(""));
    check(receiveMessages(source, 0, [](const Message &) {}) == 0,
          "empty stream");
  }

  // A stream which ends inside a message is an error.
  {
    const std::string last = mk_method_call()->toBytes();
    ByteSourceBuffer source(three_messages() + last.substr(0, last.size() / 2));
    size_t count = 0;
    try {
      receiveMessages(source, 0, [&](const Message &) { count++; });
      throw Error("Truncated stream accepted");
    } catch (const EndOfStreamError &) {
      check(count == 3, "messages before the truncated one");
    }
  }
}

void test_random_messages() {
  for (size_t i = 0; i < 2000; i++) {
    DBusRandomMersenne r(i, 200);
    std::unique_ptr<Message> message = randomMessage(r, 4);
    const std::string bytes0 = message->toBytes();
    std::unique_ptr<Message> decoded = decode(bytes0);
    check(decoded->getEndianness() == message->getEndianness(),
          "random message byte order");
    check(decoded->getHeaders() == message->getHeaders(),
          "random message headers");
    check(decoded->getBody() == message->getBody(), "random message body");
    decoded->parseBody();
    check(decoded->toBytes() == bytes0, "random message bytes");
  }
}

int main() {
  test_method_call_round_trip();
  test_header_values();
  test_missing_member();
  test_bad_byte_order();
  test_required_fields();
  test_header_checks();
  test_decode_invalid();
  test_flags_and_type();
  test_signature_required();
  test_alignment();
  test_big_endian();
  test_set_body();
  test_protocol_version();
  test_truncated();
  test_single_write();
  test_stream_of_messages();
  test_receive_messages();
  test_random_messages();
  return 0;
}
