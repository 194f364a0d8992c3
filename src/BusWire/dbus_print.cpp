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

#include "dbus_print.hpp"
#include "message.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdio.h>
#include <unistd.h>

void DBusObjectChar::print(Printer &p, size_t) const {
  p.printUint8(getValue());
}

void DBusObjectBoolean::print(Printer &p, size_t) const {
  p.printString(getValue() ? "true" : "false");
}

void DBusObjectUint16::print(Printer &p, size_t) const {
  p.printUint16(getValue());
}

void DBusObjectInt16::print(Printer &p, size_t) const {
  p.printInt16(getValue());
}

void DBusObjectUint32::print(Printer &p, size_t) const {
  p.printUint32(getValue());
}

void DBusObjectInt32::print(Printer &p, size_t) const {
  p.printInt32(getValue());
}

void DBusObjectUint64::print(Printer &p, size_t) const {
  p.printUint64(getValue());
}

void DBusObjectInt64::print(Printer &p, size_t) const {
  p.printInt64(getValue());
}

void DBusObjectDouble::print(Printer &p, size_t) const {
  p.printDouble(getValue());
}

void DBusObjectUnixFD::print(Printer &p, size_t) const {
  p.printString("fd#");
  p.printUint32(getValue());
}

void DBusObjectString::print(Printer &p, size_t) const {
  p.printChar('"');
  p.printString(getValue());
  p.printChar('"');
}

void DBusObjectPath::print(Printer &p, size_t) const {
  p.printString(getValue());
}

void DBusObjectSignature::print(Printer &p, size_t) const {
  p.printChar('\'');
  p.printString(getValue());
  p.printChar('\'');
}

void DBusObjectVariant::print(Printer &p, size_t indent) const {
  p.printString("Variant ");
  signature_.print(p, indent);
  p.printNewline(indent);
  object_->print(p, indent);
}

void DBusObjectDictEntry::print(Printer &p, size_t indent) const {
  p.printChar('{');
  p.printNewline(indent + 1);
  key_->print(p, indent + 1);
  p.printString(" =>");
  p.printNewline(indent + 1);
  value_->print(p, indent + 1);
  p.printNewline(indent);
  p.printChar('}');
}

void DBusObjectSeq::print(Printer &p, size_t indent, char lbracket,
                          char rbracket) const {
  p.printChar(lbracket);
  for (size_t i = 0; i < elements_.size(); i++) {
    if (i > 0) {
      p.printChar(',');
    }
    p.printNewline(indent + 1);
    elements_[i]->print(p, indent + 1);
  }
  p.printNewline(indent);
  p.printChar(rbracket);
}

void DBusObjectArray::print(Printer &p, size_t indent) const {
  seq_.print(p, indent, '[', ']');
}

void DBusObjectStruct::print(Printer &p, size_t indent) const {
  seq_.print(p, indent, '(', ')');
}

void DBusMessageBody::print(Printer &p, size_t indent) const {
  seq_.print(p, indent, '(', ')');
}

void HeaderValue::print(Printer &p, size_t indent) const {
  if (kind_ == HDRVAL_CONTAINER) {
    p.printString(_s("<container '") + str_ + "'>");
  } else {
    toObject()->print(p, indent);
  }
}

static void printMessageFlags(Printer &p, MessageFlags flags) {
  if (flags & MSGFLAGS_NO_REPLY_EXPECTED) {
    p.printString(" NO_REPLY_EXPECTED");
  }
  if (flags & MSGFLAGS_NO_AUTO_START) {
    p.printString(" NO_AUTO_START");
  }
  if (flags & ~MSGFLAGS_VALID_MASK) {
    p.printString(" UNKNOWN(");
    p.printUint8(flags & ~MSGFLAGS_VALID_MASK);
    p.printChar(')');
  }
}

void Message::print(Printer &p, size_t indent) const {
  p.printString("Header:");
  p.printNewline(indent + 1);

  p.printString("endianness: ");
  p.printChar(endianness_);
  p.printNewline(indent + 1);

  p.printString("message type: ");
  p.printString(messageTypeString(messageType_));
  p.printNewline(indent + 1);

  p.printString("message flags:");
  printMessageFlags(p, flags_);
  p.printNewline(indent + 1);

  p.printString("body size: ");
  p.printUint32(body_.size());
  p.printNewline(indent + 1);

  p.printString("serial number: ");
  p.printUint32(serial_);
  p.printNewline(indent + 1);

  p.printString("header fields:");
  for (const auto &header : headers_) {
    p.printNewline(indent + 2);
    p.printString(headerFieldNameString(header.first));
    p.printChar(':');
    p.printNewline(indent + 3);
    header.second.print(p, indent + 3);
  }

  if (!body_.empty()) {
    p.printNewline(indent);
    p.printString("Body:");
    p.printNewline(indent + 1);
    try {
      parseBody()->print(p, indent + 1);
    } catch (const ParseError &e) {
      p.printString(_s("<body does not match its signature: ") + e.what() +
                    ">");
    }
  }
}

template <class T>
static size_t numberToString(char *buf, T x, size_t base) {
  static const char digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  size_t n = 0;
  do {
    buf[n++] = digits[x % base];
    x = x / base;
  } while (x != 0);

  // The digits came out in reverse order.
  std::reverse(buf, buf + n);
  return n;
}

void PrinterFD::printBytes(const char *buf, size_t bufsize) {
  while (bufsize > 0) {
    const ssize_t r = write(fd_, buf, bufsize);
    if (r < 0) {
      throw ErrorWithErrno("Write failed during pretty printing");
    }
    buf += r;
    bufsize -= r;
  }
}

void PrinterFD::printChar(char c) { printBytes(&c, sizeof(c)); }

void PrinterFD::printUint8(uint8_t x) { printUint64(x); }

void PrinterFD::printInt8(int8_t x) { printInt64(x); }

void PrinterFD::printUint16(uint16_t x) { printUint64(x); }

void PrinterFD::printInt16(int16_t x) { printInt64(x); }

void PrinterFD::printUint32(uint32_t x) { printUint64(x); }

void PrinterFD::printInt32(int32_t x) { printInt64(x); }

void PrinterFD::printUint64(uint64_t x) {
  char buf[64];
  if (base_ == 16) {
    printString("0x");
  }
  const size_t n = numberToString<uint64_t>(buf, x, base_);
  printBytes(buf, n);
}

void PrinterFD::printInt64(int64_t x) {
  if (x < 0) {
    printChar('-');
    printUint64(-static_cast<uint64_t>(x));
  } else {
    printUint64(static_cast<uint64_t>(x));
  }
}

void PrinterFD::printDouble(double d) {
  char buf[128];
  const int n = snprintf(buf, sizeof(buf), "%f", d);
  if (0 <= n && static_cast<size_t>(n) < sizeof(buf)) {
    printBytes(buf, n);
  }
}

void PrinterFD::printString(const std::string &str) {
  printBytes(str.c_str(), str.size());
}

void PrinterFD::printNewline(size_t indent) {
  static const char spaces[66] =
      "\n                                                                ";
  size_t nspaces = tabsize_ * indent;
  // The indent is usually small, so the fast case prints the newline
  // and the spaces in one go.
  if (nspaces <= sizeof(spaces) - 2) {
    printBytes(spaces, nspaces + 1);
    return;
  }
  printBytes(spaces, sizeof(spaces) - 1);
  nspaces -= sizeof(spaces) - 2;
  while (nspaces > sizeof(spaces) - 2) {
    printBytes(&spaces[1], sizeof(spaces) - 2);
    nspaces -= sizeof(spaces) - 2;
  }
  printBytes(&spaces[1], nspaces);
}
