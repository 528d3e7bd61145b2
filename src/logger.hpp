/*
 *
 * logger.hpp
 * Timestamped messages and progress for the user
 *
 */
#pragma once

#include <cstddef>
#include <iostream>
#include <string>

class Logger {
public:
  Logger(std::ostream &out = std::cerr, const bool quiet = false)
      : _out(out), _quiet(quiet) {}

  void info(const std::string &msg);
  void warn(const std::string &msg);

  std::ostream &stream() { return _out; }
  bool quiet() const { return _quiet; }

private:
  void write(const char *level, const std::string &msg);

  std::ostream &_out;
  bool _quiet;
};
