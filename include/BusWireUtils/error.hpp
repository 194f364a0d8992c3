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

#include <errno.h>
#include <string.h>
#include <string>

// Exception class. Caught in main().
class Error : public std::exception {
  std::string msg_;

public:
  Error() = delete;  // No default constructor.
  explicit Error(const char* msg) : msg_(msg) {}
  explicit Error(std::string&& msg) : msg_(std::move(msg)) {}

  const char* what() const noexcept override {
    return msg_.c_str();
  }
};

// Exception class for system errors that include an errno. The errno
// must be captured before anything else can overwrite it, so it is read
// in the constructor.
class ErrorWithErrno : public Error {
  const int err_;

public:
  ErrorWithErrno() = delete;  // No default constructor.
  explicit ErrorWithErrno(const char* msg) :
    ErrorWithErrno(std::string(msg))
  {}
  explicit ErrorWithErrno(std::string&& msg) :
    ErrorWithErrno(std::move(msg), errno)
  {}
  ErrorWithErrno(std::string&& msg, int err) :
    Error(msg + ": " + strerror(err)), err_(err)
  {}

  int getErrno() const { return err_; }
};

// Thrown when a byte stream ends in the middle of a message.
class EndOfStreamError : public Error {
  // Number of bytes which were still expected.
  const size_t missing_;

public:
  explicit EndOfStreamError(size_t missing) :
    Error(std::string("Unexpected end of stream, ") +
          std::to_string(missing) + " more bytes expected."),
    missing_(missing)
  {}

  size_t getMissing() const { return missing_; }
};
