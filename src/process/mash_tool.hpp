/*
 *
 * mash_tool.hpp
 * Where to find mash and who to tell about it
 *
 */
#pragma once

#include <string>
#include <vector>

#include "logger.hpp"
#include "process.hpp"

class MashTool {
public:
  MashTool(ProcessRunner &runner, Logger &logger,
           const std::string &executable)
      : _runner(runner), _logger(logger), _executable(executable) {}

  // mash <subcommand>, ready for the options to be added
  std::vector<std::string> command(const std::string &subcommand) const {
    return {_executable, subcommand};
  }

  ProcessRunner &runner() const { return _runner; }
  Logger &logger() const { return _logger; }

private:
  ProcessRunner &_runner;
  Logger &_logger;
  std::string _executable;
};
