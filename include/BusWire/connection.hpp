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

#include "message.hpp"
#include <deque>

// Thrown by `BusConnection::call` when the reply is an Error message.
class BusCallError final : public Error {
  const std::string errorName_;
  const std::string errorMessage_;

public:
  BusCallError(std::string errorName, std::string errorMessage) :
    Error(errorName + ": " + errorMessage),
    errorName_(std::move(errorName)),
    errorMessage_(std::move(errorMessage))
  {}

  // The D-Bus error name, like "org.freedesktop.DBus.Error.UnknownMethod".
  const std::string& getErrorName() const { return errorName_; }

  // The first argument of the error reply if it is a string, otherwise
  // empty.
  const std::string& getErrorMessage() const { return errorMessage_; }
};

// A client connection to a message bus, over a stream which has already
// been authenticated. The connection assigns serial numbers and matches
// replies to method calls. Messages which arrive while waiting for a
// reply are queued and can be collected with `popPending`.
//
// Not thread-safe.
class BusConnection final {
  ByteSource& source_; // Not owned
  ByteSink& sink_;     // Not owned
  uint32_t lastSerial_;
  std::deque<std::unique_ptr<Message>> pending_;

public:
  BusConnection(ByteSource& source, ByteSink& sink) :
    source_(source), sink_(sink), lastSerial_(0)
  {}

  // The serial number for the next outgoing message. Never zero.
  uint32_t nextSerial();

  // Validate and send a message.
  void send(const Message& message);

  // Send a method call and wait for the method return or error with a
  // matching reply serial. Returns the body of the method return. Throws
  // `BusCallError` if the reply is an error.
  std::unique_ptr<DBusMessageBody> call(
    const std::string& destination,
    const std::string& path,
    const std::string& interface,
    const std::string& member,
    const DBusMessageBody& body
  );

  // Read the next message, from the queue if it is not empty.
  std::unique_ptr<Message> receive();

  // Remove the oldest queued message. Returns null if the queue is empty.
  std::unique_ptr<Message> popPending();

  size_t numPending() const { return pending_.size(); }
};
