#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

// ANSI colors for operator facing summaries on stderr.
//   customio::ColorPrinter cp;
//   cp.red("installation failed");

namespace customio {

class ColorPrinter {
public:
  ColorPrinter()
      : stream_(&std::cerr), enable_colors_(detect_tty_for_stream(*stream_)) {}

  ColorPrinter(std::ostream &os, bool enable_colors)
      : stream_(&os), enable_colors_(enable_colors) {}

  bool enabled() const { return enable_colors_; }
  std::ostream &stream() const { return *stream_; }

  void red(const std::string &msg) const { line("\033[31m", msg); }
  void green(const std::string &msg) const { line("\033[32m", msg); }

  // Green for true, red for false.
  void outcome(bool ok, const std::string &msg) const {
    ok ? green(msg) : red(msg);
  }

private:
  void line(const char *code, const std::string &msg) const {
    stream() << (enable_colors_ ? code : "") << msg
             << (enable_colors_ ? "\033[0m" : "") << std::endl;
  }

  static bool detect_tty_for_stream(std::ostream &os) {
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char *term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
  }

  std::ostream *stream_;
  bool enable_colors_;
};

} // namespace customio
