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

#include "message.hpp"
#include "dbus_serialize.hpp"
#include "utils.hpp"

std::unique_ptr<Message>
Message::methodCall(uint32_t serial, const std::string &destination,
                    const std::string &path, const std::string &interface,
                    const std::string &member, const DBusMessageBody &body,
                    MessageFlags flags, Endianness endianness) {
  auto message = std::make_unique<Message>(endianness, MSGTYPE_METHOD_CALL,
                                           flags, serial);
  message->setHeader(MSGHDR_PATH, HeaderValue::path(path));
  if (!interface.empty()) {
    message->setHeader(MSGHDR_INTERFACE, HeaderValue::string(interface));
  }
  message->setHeader(MSGHDR_MEMBER, HeaderValue::string(member));
  if (!destination.empty()) {
    message->setHeader(MSGHDR_DESTINATION, HeaderValue::string(destination));
  }
  message->setBody(body);
  return message;
}

std::unique_ptr<Message>
Message::methodReturn(uint32_t serial, uint32_t replySerial,
                      const std::string &destination,
                      const DBusMessageBody &body, Endianness endianness) {
  auto message = std::make_unique<Message>(endianness, MSGTYPE_METHOD_RETURN,
                                           MSGFLAGS_NO_REPLY_EXPECTED, serial);
  message->setHeader(MSGHDR_REPLY_SERIAL, HeaderValue::uint32(replySerial));
  if (!destination.empty()) {
    message->setHeader(MSGHDR_DESTINATION, HeaderValue::string(destination));
  }
  message->setBody(body);
  return message;
}

std::unique_ptr<Message>
Message::error(uint32_t serial, uint32_t replySerial,
               const std::string &destination, const std::string &errorName,
               const DBusMessageBody &body, Endianness endianness) {
  auto message = std::make_unique<Message>(endianness, MSGTYPE_ERROR,
                                           MSGFLAGS_NO_REPLY_EXPECTED, serial);
  message->setHeader(MSGHDR_ERROR_NAME, HeaderValue::string(errorName));
  message->setHeader(MSGHDR_REPLY_SERIAL, HeaderValue::uint32(replySerial));
  if (!destination.empty()) {
    message->setHeader(MSGHDR_DESTINATION, HeaderValue::string(destination));
  }
  message->setBody(body);
  return message;
}

std::unique_ptr<Message>
Message::signal(uint32_t serial, const std::string &path,
                const std::string &interface, const std::string &member,
                const DBusMessageBody &body, Endianness endianness) {
  auto message = std::make_unique<Message>(endianness, MSGTYPE_SIGNAL,
                                           MSGFLAGS_NO_REPLY_EXPECTED, serial);
  message->setHeader(MSGHDR_PATH, HeaderValue::path(path));
  message->setHeader(MSGHDR_INTERFACE, HeaderValue::string(interface));
  message->setHeader(MSGHDR_MEMBER, HeaderValue::string(member));
  message->setBody(body);
  return message;
}

const HeaderValue &Message::getHeader(HeaderFieldName name) const {
  auto i = headers_.find(name);
  if (i == headers_.end()) {
    throw Error(_s("Message has no ") + headerFieldNameString(name) +
                " header");
  }
  return i->second;
}

const std::string &Message::getPath() const {
  return getHeader(MSGHDR_PATH).getString();
}

const std::string &Message::getInterface() const {
  return getHeader(MSGHDR_INTERFACE).getString();
}

const std::string &Message::getMember() const {
  return getHeader(MSGHDR_MEMBER).getString();
}

const std::string &Message::getErrorName() const {
  return getHeader(MSGHDR_ERROR_NAME).getString();
}

uint32_t Message::getReplySerial() const {
  return getHeader(MSGHDR_REPLY_SERIAL).getUint32();
}

const std::string &Message::getDestination() const {
  return getHeader(MSGHDR_DESTINATION).getString();
}

const std::string &Message::getSender() const {
  return getHeader(MSGHDR_SENDER).getString();
}

const std::string &Message::getSignature() const {
  return getHeader(MSGHDR_SIGNATURE).getString();
}

template <Endianness endianness>
static std::string serializeBody(const DBusMessageBody &body) {
  std::vector<uint32_t> arraySizes;
  SerializerInitArraySizes s0(arraySizes);
  body.serialize(s0);

  std::string result;
  result.reserve(s0.getPos());
  SerializeToString<endianness> s1(arraySizes, result);
  body.serialize(s1);
  return result;
}

void Message::setBody(const DBusMessageBody &body) {
  if (endianness_ == BigEndian) {
    body_ = serializeBody<BigEndian>(body);
  } else {
    body_ = serializeBody<LittleEndian>(body);
  }

  std::string sig = body.signature();
  if (sig.empty()) {
    eraseHeader(MSGHDR_SIGNATURE);
  } else {
    setHeader(MSGHDR_SIGNATURE, HeaderValue::signature(std::move(sig)));
  }
}

std::unique_ptr<DBusMessageBody> Message::parseBody() const {
  if (body_.empty()) {
    return DBusMessageBody::mk0();
  }
  const std::string sig =
      hasHeader(MSGHDR_SIGNATURE) ? getSignature() : std::string();
  return DBusMessageBody::parse(endianness_, sig, body_.data(), body_.size());
}

void Message::validate() const {
  if (endianness_ != LittleEndian && endianness_ != BigEndian) {
    throw InvalidMessageError(INVALID_BYTE_ORDER,
                              _s("Invalid byte order: ") +
                                  std::to_string(int(endianness_)));
  }

  if ((flags_ & ~MSGFLAGS_VALID_MASK) != 0) {
    throw InvalidMessageError(INVALID_FLAGS, _s("Invalid message flags: ") +
                                                 std::to_string(int(flags_)));
  }

  if (messageType_ == MSGTYPE_INVALID || messageType_ > MSGTYPE_SIGNAL) {
    throw InvalidMessageError(INVALID_MESSAGE_TYPE,
                              _s("Invalid message type: ") +
                                  std::to_string(int(messageType_)));
  }

  for (const auto &header : headers_) {
    const HeaderFieldName name = header.first;
    if (!isKnownHeaderField(name)) {
      throw InvalidMessageError(INVALID_HEADER_FIELD,
                                _s("Invalid header field: ") +
                                    std::to_string(int(name)),
                                name);
    }
    const HeaderValueKind expected = expectedHeaderKind(name);
    const HeaderValueKind actual = header.second.getKind();
    if (actual != expected) {
      throw InvalidMessageError(HEADER_TYPE_MISMATCH,
                                _s("Header field ") +
                                    headerFieldNameString(name) +
                                    " has type '" + char(actual) +
                                    "', expected '" + char(expected) + "'",
                                name);
    }
  }

  for (HeaderFieldName name : requiredHeaderFields(messageType_)) {
    if (!hasHeader(name)) {
      throw InvalidMessageError(MISSING_REQUIRED_HEADER,
                                _s(messageTypeString(messageType_)) +
                                    " message has no " +
                                    headerFieldNameString(name) + " header",
                                name);
    }
  }

  if (!body_.empty() && !hasHeader(MSGHDR_SIGNATURE)) {
    throw InvalidMessageError(MISSING_SIGNATURE,
                              "Message has a body but no SIGNATURE header",
                              MSGHDR_SIGNATURE);
  }
}
