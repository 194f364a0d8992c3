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

#include "connection.hpp"

uint32_t BusConnection::nextSerial() {
  lastSerial_++;
  if (lastSerial_ == 0) {
    lastSerial_++;
  }
  return lastSerial_;
}

void BusConnection::send(const Message &message) {
  sendMessage(sink_, message);
}

// The first argument of an error reply, if it is a string. A body which
// doesn't match its signature has no message: the error name is still
// reported.
static std::string errorMessageOf(const Message &reply) {
  std::unique_ptr<DBusMessageBody> body;
  try {
    body = reply.parseBody();
  } catch (const ParseError &) {
    return std::string();
  }
  if (body->numElements() == 0) {
    return std::string();
  }
  const DBusObject &arg = *body->getElement(0);
  if (arg.getType().toString() != "s") {
    return std::string();
  }
  return arg.as<DBusObjectString>().getValue();
}

std::unique_ptr<DBusMessageBody>
BusConnection::call(const std::string &destination, const std::string &path,
                    const std::string &interface, const std::string &member,
                    const DBusMessageBody &body) {
  const uint32_t serial = nextSerial();
  std::unique_ptr<Message> message =
      Message::methodCall(serial, destination, path, interface, member, body);
  send(*message);

  while (true) {
    std::unique_ptr<Message> reply = receiveMessage(source_);
    const MessageType t = reply->getMessageType();
    if ((t == MSGTYPE_METHOD_RETURN || t == MSGTYPE_ERROR) &&
        reply->getReplySerial() == serial) {
      if (t == MSGTYPE_ERROR) {
        throw BusCallError(reply->getErrorName(), errorMessageOf(*reply));
      }
      return reply->parseBody();
    }
    pending_.push_back(std::move(reply));
  }
}

std::unique_ptr<Message> BusConnection::receive() {
  std::unique_ptr<Message> message = popPending();
  if (message) {
    return message;
  }
  return receiveMessage(source_);
}

std::unique_ptr<Message> BusConnection::popPending() {
  if (pending_.empty()) {
    return std::unique_ptr<Message>();
  }
  std::unique_ptr<Message> message = std::move(pending_.front());
  pending_.pop_front();
  return message;
}
