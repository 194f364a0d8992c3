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
#include "error.hpp"
#include <unistd.h>

ScopedFD::~ScopedFD() {
  if (fd_ >= 0) {
    close(fd_);
  }
}

void ByteSourceFD::readBytes(char *buf, size_t bufsize) {
  size_t pos = 0;
  while (pos < bufsize) {
    const ssize_t n = read(fd_, buf + pos, bufsize - pos);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ErrorWithErrno("read failed");
    }
    if (n == 0) {
      throw EndOfStreamError(bufsize - pos);
    }
    pos += n;
    bytesRead_ += n;
  }
}

void ByteSinkFD::writeBytes(const char *buf, size_t bufsize) {
  size_t pos = 0;
  while (pos < bufsize) {
    const ssize_t n = write(fd_, buf + pos, bufsize - pos);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ErrorWithErrno("write failed");
    }
    pos += n;
  }
}

void ByteSourceBuffer::readBytes(char *buf, size_t bufsize) {
  if (bufsize > remaining()) {
    throw EndOfStreamError(bufsize - remaining());
  }
  memcpy(buf, bytes_.data() + pos_, bufsize);
  pos_ += bufsize;
}
