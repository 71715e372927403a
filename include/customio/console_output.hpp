#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>
#include <streambuf>

#include "customio/color_printer.hpp"

namespace customio {

/**
 * Operator facing messages on stderr, gated by the CLI verbosity level
 * (0 silent, 1 error .. 5 trace). stdout is reserved for event lines.
 */
class ConsoleOutput {
  class NullBuffer : public std::streambuf {
  protected:
    int overflow(int c) override { return c; }
  };

  std::size_t verbosity_;
  std::ostream &out_;
  NullBuffer null_buffer_;
  std::ostream null_stream_{&null_buffer_};
  ColorPrinter printer_;

  std::ostream &at(std::size_t level) {
    return verbosity_ >= level ? out_ : null_stream_;
  }

public:
  explicit ConsoleOutput(std::size_t verbosity, std::ostream &out = std::cerr)
      : verbosity_(verbosity), out_(out) {}

  std::ostream &error() { return at(1); }
  std::ostream &warning() { return at(2); }
  std::ostream &info() { return at(3); }
  std::ostream &debug() { return at(4); }
  std::ostream &trace() { return at(5); }

  ColorPrinter &printer() { return printer_; }
  std::size_t verbosity() const { return verbosity_; }
};

} // namespace customio
