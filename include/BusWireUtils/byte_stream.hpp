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

#include <stddef.h>
#include <string>

// Byte streams which messages are read from and written to. They have
// no knowledge of the protocol. Errors from the underlying file
// descriptor are thrown as `ErrorWithErrno`.

class ByteSource {
public:
  virtual ~ByteSource() {}

  // Read exactly `bufsize` bytes. Throws `EndOfStreamError` if the stream
  // ends first.
  virtual void readBytes(char* buf, size_t bufsize) = 0;

  // Number of bytes consumed so far.
  virtual size_t bytesRead() const = 0;
};

class ByteSink {
public:
  virtual ~ByteSink() {}

  // Write all of `buf`.
  virtual void writeBytes(const char* buf, size_t bufsize) = 0;
};

// Owns a file descriptor and closes it when it goes out of scope. A
// negative value is held but never closed, so the result of `open()` can
// be stored before it is checked.
class ScopedFD final {
  const int fd_;

public:
  explicit ScopedFD(int fd) : fd_(fd) {}
  ScopedFD(const ScopedFD&) = delete;
  ScopedFD& operator=(const ScopedFD&) = delete;
  ~ScopedFD();

  int get() const { return fd_; }
  bool isOpen() const { return fd_ >= 0; }
};

// Reads from a blocking file descriptor, such as a socket or a pipe.
class ByteSourceFD final : public ByteSource {
  // This class is not responsible for closing the file descriptor.
  const int fd_;
  size_t bytesRead_;

public:
  explicit ByteSourceFD(int fd) : fd_(fd), bytesRead_(0) {}

  void readBytes(char* buf, size_t bufsize) override;

  size_t bytesRead() const override { return bytesRead_; }
};

class ByteSinkFD final : public ByteSink {
  // This class is not responsible for closing the file descriptor.
  const int fd_;

public:
  explicit ByteSinkFD(int fd) : fd_(fd) {}

  void writeBytes(const char* buf, size_t bufsize) override;
};

// Reads from an in-memory copy of the bytes.
class ByteSourceBuffer final : public ByteSource {
  const std::string bytes_;
  size_t pos_;

public:
  explicit ByteSourceBuffer(std::string bytes) :
    bytes_(std::move(bytes)), pos_(0)
  {}

  void readBytes(char* buf, size_t bufsize) override;

  size_t bytesRead() const override { return pos_; }

  size_t remaining() const { return bytes_.size() - pos_; }
};

// Collects everything written to it.
class ByteSinkBuffer final : public ByteSink {
  std::string bytes_;
  size_t numWrites_;

public:
  ByteSinkBuffer() : numWrites_(0) {}

  void writeBytes(const char* buf, size_t bufsize) override {
    bytes_.append(buf, bufsize);
    ++numWrites_;
  }

  const std::string& getBytes() const { return bytes_; }

  // Number of calls to `writeBytes`.
  size_t getNumWrites() const { return numWrites_; }

  void clear() {
    bytes_.clear();
    numWrites_ = 0;
  }
};
