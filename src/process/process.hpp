/*
 *
 * process.hpp
 * Running external programs
 *
 */
#pragma once

#include <functional>
#include <string>
#include <vector>

struct ProcessResult {
  int exit_code;
  std::string out; // empty when stdout was sent to a file
  std::string err;
};

typedef std::function<void(const std::string &)> LineCallback;

// Everything that shells out goes through this, so tests can swap in a fake
class ProcessRunner {
public:
  virtual ~ProcessRunner() {}

  // args[0] is the program, looked up on PATH.
  // If stdout_path is set stdout is written there rather than captured.
  // on_stderr_line sees each stderr line (without '\n') while the program runs
  virtual ProcessResult invoke(const std::vector<std::string> &args,
                               const std::string &stdout_path = "",
                               const LineCallback &on_stderr_line = nullptr) = 0;
};

// fork/exec with pipes. Exit code is 128 + signal if the child was killed,
// and 127 if the program could not be started
class PosixProcessRunner : public ProcessRunner {
public:
  ProcessResult invoke(const std::vector<std::string> &args,
                       const std::string &stdout_path = "",
                       const LineCallback &on_stderr_line = nullptr) override;
};

// For error messages
std::string format_command(const std::vector<std::string> &args);
