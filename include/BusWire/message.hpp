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

#include "byte_stream.hpp"
#include "header_fields.hpp"
#include <functional>
#include <map>

// The only major protocol version which is supported.
const uint8_t DBUS_MAJOR_PROTOCOL_VERSION = 1;

enum InvalidMessageKind {
  // Framing errors
  INVALID_BYTE_ORDER,
  INVALID_PROTOCOL_VERSION,

  // Validity errors
  INVALID_FLAGS,
  INVALID_MESSAGE_TYPE,
  INVALID_HEADER_FIELD,
  HEADER_TYPE_MISMATCH,
  MISSING_REQUIRED_HEADER,
  MISSING_SIGNATURE
};

// Thrown when a message breaks the rules of the protocol.
class InvalidMessageError final : public Error {
  const InvalidMessageKind kind_;

  // The offending header field code, or 0 if the error is not about a
  // header field.
  const uint8_t field_;

public:
  InvalidMessageError(
    InvalidMessageKind kind, std::string&& msg, uint8_t field = 0
  ) :
    Error(std::move(msg)), kind_(kind), field_(field)
  {}

  InvalidMessageKind getKind() const { return kind_; }
  uint8_t getField() const { return field_; }
};

// A D-Bus message. The header fields are kept in a map, ordered by field
// code, and the body is kept as raw bytes in the byte order of the
// message. Use `setBody` and `parseBody` to convert the body to and from
// codec objects.
//
// A `Message` can hold any values: the rules of the protocol are only
// checked by `validate`, which `sendMessage` and `receiveMessage` call.
class Message final {
  Endianness endianness_;
  MessageType messageType_;
  MessageFlags flags_;
  uint32_t serial_;
  std::map<HeaderFieldName, HeaderValue> headers_;
  std::string body_;

public:
  Message(
    Endianness endianness,
    MessageType messageType,
    MessageFlags flags,
    uint32_t serial
  ) :
    endianness_(endianness),
    messageType_(messageType),
    flags_(flags),
    serial_(serial)
  {}

  Message(
    Endianness endianness,
    MessageType messageType,
    MessageFlags flags,
    uint32_t serial,
    std::map<HeaderFieldName, HeaderValue>&& headers,
    std::string&& body
  ) :
    endianness_(endianness),
    messageType_(messageType),
    flags_(flags),
    serial_(serial),
    headers_(std::move(headers)),
    body_(std::move(body))
  {}

  static std::unique_ptr<Message> methodCall(
    uint32_t serial,
    const std::string& destination, // Omitted if empty
    const std::string& path,
    const std::string& interface, // Omitted if empty
    const std::string& member,
    const DBusMessageBody& body,
    MessageFlags flags = MSGFLAGS_EMPTY,
    Endianness endianness = LittleEndian
  );

  static std::unique_ptr<Message> methodReturn(
    uint32_t serial,
    uint32_t replySerial, // serial number that we are replying to
    const std::string& destination, // Omitted if empty
    const DBusMessageBody& body,
    Endianness endianness = LittleEndian
  );

  static std::unique_ptr<Message> error(
    uint32_t serial,
    uint32_t replySerial, // serial number that we are replying to
    const std::string& destination, // Omitted if empty
    const std::string& errorName,
    const DBusMessageBody& body,
    Endianness endianness = LittleEndian
  );

  static std::unique_ptr<Message> signal(
    uint32_t serial,
    const std::string& path,
    const std::string& interface,
    const std::string& member,
    const DBusMessageBody& body,
    Endianness endianness = LittleEndian
  );

  Endianness getEndianness() const { return endianness_; }
  MessageType getMessageType() const { return messageType_; }
  MessageFlags getFlags() const { return flags_; }
  uint32_t getSerial() const { return serial_; }

  void setMessageType(MessageType t) { messageType_ = t; }
  void setFlags(MessageFlags flags) { flags_ = flags; }
  void setSerial(uint32_t serial) { serial_ = serial; }

  const std::map<HeaderFieldName, HeaderValue>& getHeaders() const {
    return headers_;
  }

  void setHeader(HeaderFieldName name, HeaderValue value) {
    headers_.insert_or_assign(name, std::move(value));
  }

  void eraseHeader(HeaderFieldName name) { headers_.erase(name); }

  bool hasHeader(HeaderFieldName name) const {
    return headers_.find(name) != headers_.end();
  }

  // Throws `Error` if the header is absent.
  const HeaderValue& getHeader(HeaderFieldName name) const;

  // Shorthands for the header fields. They throw `Error` if the field is
  // absent or has the wrong kind.
  const std::string& getPath() const;
  const std::string& getInterface() const;
  const std::string& getMember() const;
  const std::string& getErrorName() const;
  uint32_t getReplySerial() const;
  const std::string& getDestination() const;
  const std::string& getSender() const;
  const std::string& getSignature() const;

  // The raw bytes of the body.
  const std::string& getBody() const { return body_; }
  void setRawBody(std::string&& body) { body_ = std::move(body); }

  // Serialize `body` in the byte order of this message and update the
  // signature header to match. The signature header is removed if the
  // body is empty.
  void setBody(const DBusMessageBody& body);

  // Parse the body, using the signature header. Throws `ParseError` if
  // the body doesn't match the signature.
  std::unique_ptr<DBusMessageBody> parseBody() const;

  // Check the rules of the protocol. Throws `InvalidMessageError` for the
  // first rule which is broken, in this order: byte order, flags, message
  // type, header fields in ascending code order, required header fields,
  // signature header.
  void validate() const;

  // Create a parser for a complete message. The first byte selects the
  // byte order of the rest of the message. On success, the message is
  // assigned to `result`. The message is not validated.
  static std::unique_ptr<Parse::Cont> parse(std::unique_ptr<Message>& result);

  // Write the message. The serializer's byte order must match
  // `endianness_`. The message is not validated.
  void serialize(Serializer& s) const;

  // Validate and encode the message.
  std::string toBytes() const;

  void print(Printer& p, size_t indent) const;
};

// Read one message from `source` and validate it. Throws
// `InvalidMessageError` or `ParseError` if the message is invalid.
// Errors from `source` are passed through.
std::unique_ptr<Message> receiveMessage(ByteSource& source);

// Read messages from `source` and pass each one to `f`, until the stream
// ends between two messages or `maxMessages` have been read (0 means no
// limit). Returns the number of messages read. A stream which ends in the
// middle of a message throws `EndOfStreamError`.
size_t receiveMessages(
  ByteSource& source,
  size_t maxMessages,
  const std::function<void(const Message&)>& f
);

// Validate `message` and write it to `sink` with a single call to
// `writeBytes`. Nothing is written if the message is invalid.
void sendMessage(ByteSink& sink, const Message& message);
