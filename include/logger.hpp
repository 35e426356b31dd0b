#pragma once
#include <ostream>
#include <string>

/**
 * Line logger over a caller-owned stream.
 * Components never log through a global; they take a Logger* (may be null).
 */
class Logger {
 public:
  Logger(std::ostream& out, const std::string& tag = "") : out(out), tag(tag) {}
  void log(const std::string& stmt);

 private:
  std::ostream& out;
  std::string tag;
};
