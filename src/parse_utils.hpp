/*
 *
 * parse_utils.hpp
 * Strict conversions for the tab-separated text mash prints
 *
 */
#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

inline std::vector<std::string> split_fields(const std::string &line,
                                             const char delim = '\t') {
  std::vector<std::string> fields;
  size_t start = 0;
  size_t end;
  while ((end = line.find(delim, start)) != std::string::npos) {
    fields.push_back(line.substr(start, end - start));
    start = end + 1;
  }
  fields.push_back(line.substr(start));
  return fields;
}

// Digits only, no sign or whitespace
inline bool parse_count(const std::string &field, size_t &value) {
  if (field.empty() ||
      field.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  errno = 0;
  char *end = nullptr;
  const unsigned long long parsed = std::strtoull(field.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') {
    return false;
  }
  value = static_cast<size_t>(parsed);
  return true;
}

// Whole field must be a number (mash prints p-values such as 1.2e-310, which
// underflow but are still numbers)
inline bool parse_real(const std::string &field, double &value) {
  if (field.empty() || field.find_first_of(" \t\r\n") != std::string::npos) {
    return false;
  }
  char *end = nullptr;
  const double parsed = std::strtod(field.c_str(), &end);
  if (end == field.c_str() || *end != '\0') {
    return false;
  }
  value = parsed;
  return true;
}

inline std::string strip_cr(const std::string &line) {
  if (!line.empty() && line.back() == '\r') {
    return line.substr(0, line.size() - 1);
  }
  return line;
}
