#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

// ANSI colors for terminal output. Colors switch on automatically when the
// stream is a TTY and TERM is not "dumb".
//
//   lanlens::customio::ColorPrinter cp(std::cout);
//   cp.green() << "online" << std::endl;  // reset emitted automatically
//   cp.red("scan failed");

namespace lanlens::customio {

class ColorPrinter {
 public:
  // Emits the color code on construction and the reset on destruction.
  class ColorProxy {
   public:
    ColorProxy(std::ostream& os, const char* code, bool enabled)
        : os_(os), enabled_(enabled) {
      if (enabled_) os_ << code;
    }
    ~ColorProxy() {
      if (enabled_) os_ << "\033[0m";
    }
    template <typename T>
    ColorProxy& operator<<(const T& v) {
      os_ << v;
      return *this;
    }
    using Manip = std::ostream& (*)(std::ostream&);
    ColorProxy& operator<<(Manip m) {
      m(os_);
      return *this;
    }

   private:
    std::ostream& os_;
    bool enabled_;
  };

  explicit ColorPrinter(std::ostream& os)
      : stream_(&os), enable_colors_(detect_tty_for_stream(os)) {}
  ColorPrinter(std::ostream& os, bool enable_colors)
      : stream_(&os), enable_colors_(enable_colors) {}

  void set_enabled(bool enabled) { enable_colors_ = enabled; }
  bool enabled() const { return enable_colors_; }
  std::ostream& stream() const { return *stream_; }

  ColorProxy bold() { return proxy("\033[1m"); }
  ColorProxy dim() { return proxy("\033[2m"); }
  ColorProxy red() { return proxy("\033[31m"); }
  ColorProxy green() { return proxy("\033[32m"); }
  ColorProxy yellow() { return proxy("\033[33m"); }
  ColorProxy blue() { return proxy("\033[34m"); }
  ColorProxy cyan() { return proxy("\033[36m"); }

  void red(const std::string& msg) { red() << msg << std::endl; }
  void green(const std::string& msg) { green() << msg << std::endl; }
  void yellow(const std::string& msg) { yellow() << msg << std::endl; }

 private:
  ColorProxy proxy(const char* code) {
    return ColorProxy(*stream_, code, enable_colors_);
  }

  static bool detect_tty_for_stream(std::ostream& os) {
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char* term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
  }

  std::ostream* stream_;
  bool enable_colors_;
};

}  // namespace lanlens::customio
