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

#include "endianness.hpp"
#include <assert.h>
#include <memory>
#include <string>

// Continuation-passing-style parser implementation. The main class
// is `Parse`. You initialize the parser with a continuation of
// type `Parse::Cont`. The continuation consumes a fixed number of
// bytes and returns a new continuation to keep parsing the rest of
// the input. The continuation-passing design has several benefits:
//
// 1. It consumes the input in small chunks, so it is easy to feed it
//    from a byte stream. The caller asks the parser how many bytes it
//    wants next, reads exactly that many, and never reads past the end
//    of the current message.
// 2. Because the parser processes data incrementally it can reject
//    invalid messages early, without needing to wait for the whole
//    message to arrive. For example, a bad byte order marker is rejected
//    after the first byte.
// 3. The implementation does not use recursion, so it is impossible for a
//    malicious input to trigger stack exhaustion in the parser. There is
//    still a parsing stack, but it consists of a linked list of
//    continuations on the heap.

// Thrown as an exception when the parser encounters an invalid input.
class ParseError final : public std::exception {
  // Byte position of the parse error.
  const size_t pos_;

  // Error message.
  std::string msg_;

public:
  ParseError() = delete; // No default constructor.
  explicit ParseError(size_t pos, const char *msg) : pos_(pos), msg_(msg) {}
  explicit ParseError(size_t pos, std::string &&msg)
      : pos_(pos), msg_(std::move(msg)) {}

  size_t getPos() const noexcept { return pos_; }

  const char *what() const noexcept override { return msg_.c_str(); }
};

class Parse final {
public:
  // This class has a virtual method which is the continuation function.
  class Cont;

  // The parsing state is the number of bytes parsed so far. A const
  // reference to the state is passed to `Parse::Cont::parse()` so that
  // the parsers can calculate the alignment of the current byte position.
  class State {
    friend Parse;

  protected:
    // The number of bytes parsed so far, counted from the start of the
    // message. This is used for calculating alignments.
    size_t pos_;

    explicit State(size_t pos) : pos_(pos) {}

  public:
    // No copy constructor
    State(const State &) = delete;

    size_t getPos() const { return pos_; }

    static const State initialState_;
  };

private:
  State state_;
  std::unique_ptr<Parse::Cont> cont_;

public:
  // No copy constructor
  Parse(const Parse &) = delete;

  // For initializing the parser.
  explicit Parse(std::unique_ptr<Parse::Cont> &&cont)
      : state_(0), cont_(std::move(cont)) {}

  // Feed the next `bufsize` bytes to the parser. The value of `bufsize`
  // must satisfy:
  //
  //   1. minRequiredBytes() <= bufsize
  //   2. bufsize <= maxRequiredBytes()
  //
  // A fixed size buffer of 255 bytes is always big enough to make
  // progress.
  void parse(const char *buf, size_t bufsize);

  // The number of bytes parsed so far.
  size_t getPos() const { return state_.pos_; }

  // The minimum number of bytes that the parser needs to make
  // progress. Scalar parsers, like the one for `uint32_t`, need all of
  // their bytes at once.
  uint8_t minRequiredBytes() const;

  // The maximum number of bytes that the parser is prepared to
  // consume at this time. If this method returns 0 then it
  // means that parsing is complete.
  size_t maxRequiredBytes() const;

  // Run the parser over an in-memory buffer, which must contain exactly
  // one complete input.
  void parseBuffer(const char *buf, size_t bufsize);
};

class Parse::Cont {
public:
  virtual ~Cont() {}
  virtual std::unique_ptr<Parse::Cont>
  parse(const Parse::State &p, const char *buf, size_t bufsize) = 0;

  // The minimum number of bytes that this continuation is willing to
  // accept.
  virtual uint8_t minRequiredBytes() const = 0;

  // The maximum number of bytes that this continuation is willing to
  // accept.
  virtual size_t maxRequiredBytes() const = 0;
};

// This continuation is used to indicate that parsing is complete.
// It does so by returning 0 in `maxRequiredBytes`.
class ParseStop final : public Parse::Cont {
public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseStop() {}

  virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                             const char *buf, size_t) override;

  // Factory method.
  static std::unique_ptr<Parse::Cont> mk();

  uint8_t minRequiredBytes() const override { return 0; }
  size_t maxRequiredBytes() const override { return 0; }
};

class ParseChar final : public Parse::Cont {
public:
  class Cont {
  public:
    virtual ~Cont() {}
    virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                               char c) = 0;
  };

private:
  // Continuation
  const std::unique_ptr<Cont> cont_;

public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseChar(std::unique_ptr<Cont> &&cont) : cont_(std::move(cont)) {}

  virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                             const char *buf, size_t) override;

  // Factory method.
  static std::unique_ptr<Parse::Cont> mk(std::unique_ptr<Cont> &&cont);

  uint8_t minRequiredBytes() const override { return sizeof(char); }
  size_t maxRequiredBytes() const override { return sizeof(char); }
};

// Parser for a fixed-width unsigned integer in the given byte order.
template <class T, Endianness endianness>
class ParseUint final : public Parse::Cont {
public:
  class Cont {
  public:
    virtual ~Cont() {}
    virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                               T x) = 0;
  };

private:
  // Continuation
  const std::unique_ptr<Cont> cont_;

public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseUint(std::unique_ptr<Cont> &&cont) : cont_(std::move(cont)) {}

  virtual std::unique_ptr<Parse::Cont>
  parse(const Parse::State &p, const char *buf, size_t bufsize) override {
    (void)bufsize;
    assert(bufsize == sizeof(T));
    return cont_->parse(p, readUint<endianness, T>(buf));
  }

  // Factory method.
  static std::unique_ptr<Parse::Cont> mk(std::unique_ptr<Cont> &&cont) {
    return std::make_unique<ParseUint>(std::move(cont));
  }

  uint8_t minRequiredBytes() const override { return sizeof(T); }
  size_t maxRequiredBytes() const override { return sizeof(T); }
};

template <Endianness endianness>
using ParseUint32 = ParseUint<uint32_t, endianness>;

// Parser for a std::string with a known length.
class ParseNChars final : public Parse::Cont {
public:
  class Cont {
  public:
    virtual ~Cont() {}
    virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p,
                                               std::string &&str) = 0;
  };

private:
  // Buffer for the bytes. (May already contain some bytes
  // which were already received on a previous iteration.)
  std::string str_;

  // Number of bytes we expect to receive.
  const size_t n_;

  // Continuation
  std::unique_ptr<Cont> cont_;

public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseNChars(std::string &&str, size_t n, std::unique_ptr<Cont> &&cont)
      : str_(std::move(str)), n_(n), cont_(std::move(cont)) {}

  virtual std::unique_ptr<Parse::Cont>
  parse(const Parse::State &p, const char *buf, size_t bufsize) override;

  // Factory method.
  static std::unique_ptr<Parse::Cont> mk(const Parse::State &p,
                                         std::string &&str, size_t n,
                                         std::unique_ptr<Cont> &&cont);

  uint8_t minRequiredBytes() const override { return 0; }
  size_t maxRequiredBytes() const override { return n_; }
};

// Continuation for the parsers which only consume bytes without
// producing a value.
class ParseBytesCont {
public:
  virtual ~ParseBytesCont() {}
  virtual std::unique_ptr<Parse::Cont> parse(const Parse::State &p) = 0;
};

// Parse N bytes and check that they are all zero bytes.
class ParseZeros final : public Parse::Cont {
public:
  typedef ParseBytesCont Cont;

private:
  // Number of bytes we expect to receive.
  const size_t n_;

  // Continuation
  std::unique_ptr<Cont> cont_;

public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseZeros(size_t n, std::unique_ptr<Cont> &&cont)
      : n_(n), cont_(std::move(cont)) {}

  virtual std::unique_ptr<Parse::Cont>
  parse(const Parse::State &p, const char *buf, size_t bufsize) override;

  // Factory method.
  // Note: if `n == 0` then this will invoke the continuation immediately.
  static std::unique_ptr<Parse::Cont> mk(const Parse::State &p, size_t n,
                                         std::unique_ptr<Cont> &&cont);

  uint8_t minRequiredBytes() const override { return 0; }
  size_t maxRequiredBytes() const override { return n_; }
};

// Parse N bytes and discard them, whatever their value.
class ParseSkip final : public Parse::Cont {
public:
  typedef ParseBytesCont Cont;

private:
  // Number of bytes still to be skipped.
  const size_t n_;

  // Continuation
  std::unique_ptr<Cont> cont_;

public:
  // This constructor is only public for std::make_unique's benefit.
  // Use factory method `mk()` to construct.
  ParseSkip(size_t n, std::unique_ptr<Cont> &&cont)
      : n_(n), cont_(std::move(cont)) {}

  virtual std::unique_ptr<Parse::Cont>
  parse(const Parse::State &p, const char *buf, size_t bufsize) override;

  // Factory method.
  // Note: if `n == 0` then this will invoke the continuation immediately.
  static std::unique_ptr<Parse::Cont> mk(const Parse::State &p, size_t n,
                                         std::unique_ptr<Cont> &&cont);

  uint8_t minRequiredBytes() const override { return 0; }
  size_t maxRequiredBytes() const override { return n_; }
};

// Number of padding bytes needed to bring `pos` up to a multiple of
// `alignment`, which must be a power of 2.
inline size_t paddingFor(size_t pos, size_t alignment) {
  assert((alignment & (alignment - 1)) == 0);
  return (alignment - 1) & -pos;
}
