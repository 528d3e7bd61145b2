/*
 *
 * errors.hpp
 * Exception types raised to callers
 *
 */
#pragma once

#include <stdexcept>
#include <string>

// Inputs disagree with each other or with files already on disk.
// Fix the inputs (or remove the stale file) and run again
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

// mash exited with an error or did not write what it should have
class ToolError : public std::runtime_error {
public:
  explicit ToolError(const std::string &what) : std::runtime_error(what) {}
};
