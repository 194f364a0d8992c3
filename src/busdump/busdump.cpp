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
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static void usage(const char *progname) {
  fprintf(stderr,
          "usage: %s [-x] [-t tabsize] [-n count] [file]\n"
          "Decode D-Bus messages from file, or stdin, and print them.\n"
          "  -x          print numbers in hexadecimal\n"
          "  -t tabsize  indent width (default 2)\n"
          "  -n count    stop after count messages\n",
          progname);
}

static size_t parseCount(const char *arg, const char *what) {
  char *end = nullptr;
  const unsigned long n = strtoul(arg, &end, 10);
  if (*arg == '\0' || *end != '\0') {
    throw Error(_s("Invalid ") + what + ": " + arg);
  }
  return n;
}

int main(int argc, char *argv[]) {
  size_t base = 10;
  size_t tabsize = 2;
  size_t maxMessages = 0;

  try {
    int opt;
    while ((opt = getopt(argc, argv, "xt:n:h")) != -1) {
      switch (opt) {
      case 'x':
        base = 16;
        break;
      case 't':
        tabsize = parseCount(optarg, "tabsize");
        break;
      case 'n':
        maxMessages = parseCount(optarg, "count");
        break;
      case 'h':
        usage(argv[0]);
        return EXIT_SUCCESS;
      default:
        usage(argv[0]);
        return EXIT_FAILURE;
      }
    }
    if (argc - optind > 1) {
      usage(argv[0]);
      return EXIT_FAILURE;
    }

    const char *filename = optind < argc ? argv[optind] : nullptr;
    ScopedFD file(filename ? open(filename, O_RDONLY | O_CLOEXEC) : -1);
    if (filename && !file.isOpen()) {
      throw ErrorWithErrno(_s("Could not open ") + filename);
    }

    ByteSourceFD source(filename ? file.get() : STDIN_FILENO);
    PrinterFD printer(STDOUT_FILENO, base, tabsize);
    const size_t count =
        receiveMessages(source, maxMessages, [&printer](const Message &m) {
          m.print(printer, 0);
          printer.printNewline(0);
        });
    fprintf(stderr, "busdump: %zu messages, %zu bytes\n", count,
            source.bytesRead());
    return EXIT_SUCCESS;
  } catch (const InvalidMessageError &e) {
    fprintf(stderr, "busdump: invalid message (field %d): %s\n",
            int(e.getField()), e.what());
  } catch (const ParseError &e) {
    fprintf(stderr, "busdump: parse error at byte %zu: %s\n", e.getPos(),
            e.what());
  } catch (const Error &e) {
    fprintf(stderr, "busdump: %s\n", e.what());
  }
  return EXIT_FAILURE;
}
