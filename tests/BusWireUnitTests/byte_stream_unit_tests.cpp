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

#include "byte_stream.hpp"
#include "message.hpp"
#include "utils.hpp"
#include <fcntl.h>
#include <unistd.h>

void check(bool ok, const char *what) {
  if (!ok) {
    throw Error(_s("Check failed: ") + what);
  }
}

// Write a message into a pipe and read it back out.
void test_pipe() {
  int fds[2];
  if (pipe(fds) < 0) {
    throw ErrorWithErrno("pipe failed");
  }
  ScopedFD readEnd(fds[0]);
  std::unique_ptr<Message> message = Message::methodCall(
      9, "org.example", "/org/example", "", "Ping",
      *DBusMessageBody::mk1(DBusObjectString::mk("hello")));
  {
    ScopedFD writeEnd(fds[1]);
    ByteSinkFD sink(writeEnd.get());
    sendMessage(sink, *message);
  }

  ByteSourceFD source(readEnd.get());
  std::unique_ptr<Message> received = receiveMessage(source);
  check(received->getSerial() == 9, "serial");
  check(!received->hasHeader(MSGHDR_INTERFACE), "no interface header");
  check(source.bytesRead() == message->toBytes().size(), "bytes read");

  // The write end is closed, so the next read hits the end of the stream.
  char c;
  try {
    source.readBytes(&c, 1);
  } catch (const EndOfStreamError &e) {
    check(e.getMissing() == 1, "missing bytes");
    return;
  }
  throw Error("Read past the end of the pipe");
}

void test_scoped_fd() {
  int fd;
  {
    ScopedFD file(open("/dev/null", O_RDONLY | O_CLOEXEC));
    check(file.isOpen(), "open /dev/null");
    fd = file.get();
    check(fcntl(fd, F_GETFD) >= 0, "descriptor is open in scope");
  }
  check(fcntl(fd, F_GETFD) < 0 && errno == EBADF, "descriptor closed");

  // A failed open is held but not closed.
  ScopedFD missing(open("/nonexistent/file", O_RDONLY | O_CLOEXEC));
  check(!missing.isOpen() && missing.get() < 0, "failed open");
}

void test_bad_fd() {
  ByteSinkFD sink(-1);
  try {
    sink.writeBytes("x", 1);
  } catch (const ErrorWithErrno &e) {
    check(e.getErrno() == EBADF, "EBADF");
    return;
  }
  throw Error("Write to a bad file descriptor succeeded");
}

void test_buffers() {
  ByteSourceBuffer source(_s("abcdef"));
  char buf[4];
  source.readBytes(buf, 4);
  check(std::string(buf, 4) == "abcd", "first read");
  check(source.bytesRead() == 4 && source.remaining() == 2, "position");
  try {
    source.readBytes(buf, 3);
    throw Error("Read past the end of the buffer");
  } catch (const EndOfStreamError &e) {
    check(e.getMissing() == 1, "missing bytes");
  }
  check(source.bytesRead() == 4, "failed read consumes nothing");

  ByteSinkBuffer sink;
  sink.writeBytes("ab", 2);
  sink.writeBytes("c", 1);
  check(sink.getBytes() == "abc" && sink.getNumWrites() == 2, "sink");
  sink.clear();
  check(sink.getBytes().empty() && sink.getNumWrites() == 0, "cleared sink");
}

int main() {
  test_pipe();
  test_scoped_fd();
  test_bad_fd();
  test_buffers();
  return 0;
}
