/*
 *
 * process.cpp
 * fork/exec an external program, collecting its output
 *
 */

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "process.hpp"

namespace {

const size_t read_chunk = 65536;
const int exec_failed_code = 127;

std::string errno_msg(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Closes any pipe ends still open if we leave early
struct PipePair {
  int fds[2] = {-1, -1};
  ~PipePair() {
    close_fd(fds[0]);
    close_fd(fds[1]);
  }
};

// Passes complete lines to the callback, keeps the remainder
void emit_lines(std::string &pending, const LineCallback &on_line) {
  size_t start = 0;
  size_t newline;
  while ((newline = pending.find('\n', start)) != std::string::npos) {
    on_line(pending.substr(start, newline - start));
    start = newline + 1;
  }
  pending.erase(0, start);
}

[[noreturn]] void exec_child(const std::vector<std::string> &args,
                             const int out_fd, const int err_fd) {
  if (dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0) {
    _exit(exec_failed_code);
  }
  std::vector<char *> argv;
  for (auto arg_it = args.cbegin(); arg_it != args.cend(); ++arg_it) {
    argv.push_back(const_cast<char *>(arg_it->c_str()));
  }
  argv.push_back(nullptr);
  execvp(argv[0], argv.data());

  // Only reached if exec failed, stderr is the pipe back to the parent
  const std::string msg =
      "Could not run " + args[0] + ": " + std::strerror(errno) + "\n";
  ssize_t written = write(STDERR_FILENO, msg.c_str(), msg.size());
  (void)written;
  _exit(exec_failed_code);
}

} // namespace

std::string format_command(const std::vector<std::string> &args) {
  std::string command;
  for (auto arg_it = args.cbegin(); arg_it != args.cend(); ++arg_it) {
    if (arg_it != args.cbegin()) {
      command += " ";
    }
    command += *arg_it;
  }
  return command;
}

ProcessResult PosixProcessRunner::invoke(const std::vector<std::string> &args,
                                         const std::string &stdout_path,
                                         const LineCallback &on_stderr_line) {
  if (args.empty()) {
    throw std::runtime_error("No program given to run");
  }

  ProcessResult result;
  result.exit_code = -1;

  const bool capture_out = stdout_path.empty();
  PipePair out_pipe, err_pipe;
  if (capture_out) {
    if (pipe(out_pipe.fds) != 0) {
      throw std::runtime_error(errno_msg("Could not create pipe"));
    }
  } else {
    out_pipe.fds[1] =
        open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (out_pipe.fds[1] < 0) {
      throw std::runtime_error(errno_msg("Could not open " + stdout_path));
    }
  }
  if (pipe(err_pipe.fds) != 0) {
    throw std::runtime_error(errno_msg("Could not create pipe"));
  }

  pid_t pid = fork();
  if (pid < 0) {
    throw std::runtime_error(errno_msg("Could not fork to run " + args[0]));
  } else if (pid == 0) {
    close_fd(out_pipe.fds[0]);
    close_fd(err_pipe.fds[0]);
    exec_child(args, out_pipe.fds[1], err_pipe.fds[1]);
  }

  // Parent keeps only the read ends
  close_fd(out_pipe.fds[1]);
  close_fd(err_pipe.fds[1]);

  std::string pending_err;
  std::vector<char> buffer(read_chunk);
  while (out_pipe.fds[0] >= 0 || err_pipe.fds[0] >= 0) {
    struct pollfd polled[2];
    int n_polled = 0;
    int *owners[2];
    if (out_pipe.fds[0] >= 0) {
      polled[n_polled].fd = out_pipe.fds[0];
      polled[n_polled].events = POLLIN;
      polled[n_polled].revents = 0;
      owners[n_polled++] = &out_pipe.fds[0];
    }
    if (err_pipe.fds[0] >= 0) {
      polled[n_polled].fd = err_pipe.fds[0];
      polled[n_polled].events = POLLIN;
      polled[n_polled].revents = 0;
      owners[n_polled++] = &err_pipe.fds[0];
    }

    if (poll(polled, n_polled, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string msg = errno_msg("Error waiting on " + args[0]);
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      throw std::runtime_error(msg);
    }

    for (int i = 0; i < n_polled; ++i) {
      if (polled[i].revents == 0) {
        continue;
      }
      ssize_t n_read = read(polled[i].fd, buffer.data(), buffer.size());
      if (n_read < 0 && errno == EINTR) {
        continue;
      }
      if (n_read <= 0) {
        close_fd(*owners[i]);
        continue;
      }
      if (owners[i] == &out_pipe.fds[0]) {
        result.out.append(buffer.data(), n_read);
      } else {
        result.err.append(buffer.data(), n_read);
        if (on_stderr_line) {
          pending_err.append(buffer.data(), n_read);
          emit_lines(pending_err, on_stderr_line);
        }
      }
    }
  }
  if (on_stderr_line && !pending_err.empty()) {
    on_stderr_line(pending_err);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(errno_msg("Error waiting on " + args[0]));
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}
