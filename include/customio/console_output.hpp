#pragma once

#include <iostream>
#include <ostream>
#include <streambuf>

#include "customio/color_printer.hpp"

namespace lanlens::customio {

/**
 * Console channels for the CLI. Results go to out() unconditionally;
 * diagnostics go to stderr and are filtered by the verbosity level
 * (0 silent, 1 error, 2 warning, 3 info, 4 debug, 5 trace).
 */
class ConsoleOutput {
  class NullBuffer : public std::streambuf {
  protected:
    int overflow(int c) override { return c; }
  };

  size_t verbosity_;
  std::ostream &out_;
  std::ostream &err_;
  NullBuffer null_buffer_;
  std::ostream null_stream_{&null_buffer_};
  ColorPrinter printer_;

  std::ostream &at(size_t level) {
    return verbosity_ >= level ? err_ : null_stream_;
  }

public:
  explicit ConsoleOutput(size_t verbosity, std::ostream &out = std::cout,
                         std::ostream &err = std::cerr)
      : verbosity_(verbosity), out_(out), err_(err), printer_(out) {}

  ConsoleOutput(const ConsoleOutput &) = delete;
  ConsoleOutput &operator=(const ConsoleOutput &) = delete;

  size_t verbosity() const { return verbosity_; }

  std::ostream &out() { return out_; }
  ColorPrinter &printer() { return printer_; }

  std::ostream &error() { return at(1); }
  std::ostream &warning() { return at(2); }
  std::ostream &info() { return at(3); }
  std::ostream &debug() { return at(4); }
  std::ostream &trace() { return at(5); }
};

} // namespace lanlens::customio
