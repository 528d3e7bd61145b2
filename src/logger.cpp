/*
 *
 * logger.cpp
 * Timestamped messages
 *
 */

#include <ctime>

#include "logger.hpp"

void Logger::info(const std::string &msg) {
  if (!_quiet) {
    write("INFO", msg);
  }
}

// Warnings are shown even when quiet
void Logger::warn(const std::string &msg) { write("WARNING", msg); }

void Logger::write(const char *level, const std::string &msg) {
  char stamp[32];
  std::time_t now = std::time(nullptr);
  std::tm local_tm;
  localtime_r(&now, &local_tm);
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local_tm);
  _out << "[" << stamp << "] " << level << ": " << msg << std::endl;
}
