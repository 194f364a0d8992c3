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
#include "utils.hpp"

// State which is built up while the message is parsed. It is handed from
// one continuation to the next.
struct MessageParseState {
  std::unique_ptr<Message> &result_; // Not owned
  MessageType messageType_;
  MessageFlags flags_;
  uint32_t bodySize_;
  uint32_t serial_;
  std::map<HeaderFieldName, HeaderValue> headers_;

  explicit MessageParseState(std::unique_ptr<Message> &result)
      : result_(result), messageType_(MSGTYPE_INVALID),
        flags_(MSGFLAGS_EMPTY), bodySize_(0), serial_(0) {}
};

// Convert the decoded `a(yv)` array to the header map. If the same field
// code appears more than once, the last value wins.
static void
headerFieldsFromObject(std::map<HeaderFieldName, HeaderValue> &headers,
                       const DBusObject &obj) {
  const DBusObjectArray &fields = obj.as<DBusObjectArray>();
  const size_t n = fields.numElements();
  for (size_t i = 0; i < n; i++) {
    const DBusObjectStruct &field = fields.getElement(i)->as<DBusObjectStruct>();
    const HeaderFieldName name = static_cast<HeaderFieldName>(
        field.getElement(0)->as<DBusObjectChar>().getValue());
    const DBusObjectVariant &value =
        field.getElement(1)->as<DBusObjectVariant>();
    headers.insert_or_assign(name, HeaderValue::fromObject(*value.getValue()));
  }
}

template <Endianness endianness>
static std::unique_ptr<Parse::Cont>
parseMessageAfterByteOrder(std::unique_ptr<MessageParseState> &&state) {
  typedef std::unique_ptr<MessageParseState> StatePtr;

  class BodyCont final : public ParseNChars::Cont {
    StatePtr state_;

  public:
    explicit BodyCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       std::string &&body) override {
      state_->result_ = std::make_unique<Message>(
          endianness, state_->messageType_, state_->flags_, state_->serial_,
          std::move(state_->headers_), std::move(body));
      return ParseStop::mk();
    }
  };

  // The padding before the body is discarded without being checked.
  class PaddingCont final : public ParseSkip::Cont {
    StatePtr state_;

  public:
    explicit PaddingCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p) override {
      const size_t bodySize = state_->bodySize_;
      return ParseNChars::mk(p, std::string(), bodySize,
                             std::make_unique<BodyCont>(std::move(state_)));
    }
  };

  class HeaderFieldsCont final : public DBusType::ParseObjectCont<endianness> {
    StatePtr state_;

  public:
    explicit HeaderFieldsCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont>
    parse(const Parse::State &p, std::unique_ptr<DBusObject> &&obj) override {
      headerFieldsFromObject(state_->headers_, *obj);

      // The body is 8-byte aligned.
      return ParseSkip::mk(p, paddingFor(p.getPos(), sizeof(uint64_t)),
                           std::make_unique<PaddingCont>(std::move(state_)));
    }
  };

  class SerialCont final : public ParseUint32<endianness>::Cont {
    StatePtr state_;

  public:
    explicit SerialCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                       uint32_t serial) override {
      state_->serial_ = serial;
      return headerFieldsType.mkObjectParser<endianness>(
          p, std::make_unique<HeaderFieldsCont>(std::move(state_)));
    }
  };

  class BodySizeCont final : public ParseUint32<endianness>::Cont {
    StatePtr state_;

  public:
    explicit BodySizeCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       uint32_t bodySize) override {
      state_->bodySize_ = bodySize;
      return ParseUint32<endianness>::mk(
          std::make_unique<SerialCont>(std::move(state_)));
    }
  };

  class VersionCont final : public ParseChar::Cont {
    StatePtr state_;

  public:
    explicit VersionCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       char c) override {
      const uint8_t version = static_cast<uint8_t>(c);
      if (version != DBUS_MAJOR_PROTOCOL_VERSION) {
        throw InvalidMessageError(INVALID_PROTOCOL_VERSION,
                                  _s("Unsupported protocol version: ") +
                                      std::to_string(version));
      }
      return ParseUint32<endianness>::mk(
          std::make_unique<BodySizeCont>(std::move(state_)));
    }
  };

  class FlagsCont final : public ParseChar::Cont {
    StatePtr state_;

  public:
    explicit FlagsCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       char c) override {
      state_->flags_ = static_cast<MessageFlags>(c);
      return ParseChar::mk(std::make_unique<VersionCont>(std::move(state_)));
    }
  };

  class TypeCont final : public ParseChar::Cont {
    StatePtr state_;

  public:
    explicit TypeCont(StatePtr &&state) : state_(std::move(state)) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       char c) override {
      state_->messageType_ = static_cast<MessageType>(c);
      return ParseChar::mk(std::make_unique<FlagsCont>(std::move(state_)));
    }
  };

  return ParseChar::mk(std::make_unique<TypeCont>(std::move(state)));
}

std::unique_ptr<Parse::Cont>
Message::parse(std::unique_ptr<Message> &result) {
  class ByteOrderCont final : public ParseChar::Cont {
    std::unique_ptr<Message> &result_; // Not owned

  public:
    explicit ByteOrderCont(std::unique_ptr<Message> &result)
        : result_(result) {}

    std::unique_ptr<Parse::Cont> parse(const Parse::State &,
                                       char c) override {
      auto state = std::make_unique<MessageParseState>(result_);
      switch (c) {
      case LittleEndian:
        return parseMessageAfterByteOrder<LittleEndian>(std::move(state));
      case BigEndian:
        return parseMessageAfterByteOrder<BigEndian>(std::move(state));
      default:
        throw InvalidMessageError(INVALID_BYTE_ORDER,
                                  _s("Invalid byte order marker: ") +
                                      std::to_string(int(c)));
      }
    }
  };

  return ParseChar::mk(std::make_unique<ByteOrderCont>(result));
}

// The source is read in chunks of at most `sizeof(buf)` bytes, and never
// beyond the end of the message.
std::unique_ptr<Message> receiveMessage(ByteSource &source) {
  std::unique_ptr<Message> message;
  Parse p(Message::parse(message));

  char buf[256];
  while (true) {
    size_t required = p.maxRequiredBytes();
    if (required == 0) {
      break;
    }
    if (required > sizeof(buf)) {
      required = sizeof(buf);
    }
    source.readBytes(buf, required);
    p.parse(buf, required);
  }

  message->validate();
  return message;
}

size_t receiveMessages(ByteSource &source, size_t maxMessages,
                       const std::function<void(const Message &)> &f) {
  size_t count = 0;
  while (maxMessages == 0 || count < maxMessages) {
    const size_t startPos = source.bytesRead();
    std::unique_ptr<Message> message;
    try {
      message = receiveMessage(source);
    } catch (const EndOfStreamError &) {
      if (source.bytesRead() == startPos) {
        // Clean end of input, between two messages.
        break;
      }
      throw;
    }
    f(*message);
    count++;
  }
  return count;
}
