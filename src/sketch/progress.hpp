#pragma once

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>

class ProgressMeter {
public:
  ProgressMeter(size_t total, const std::string &unit, std::ostream &out,
                const bool quiet = false)
      : total_(total), count_(0), unit_(unit), out_(out), quiet_(quiet) {
    tick(0);
  }

  void tick(size_t blocks) {
    count_ += blocks;
    if (quiet_) {
      return;
    }
    double progress =
        total_ == 0 ? 1 : count_ / static_cast<double>(total_);
    progress = progress > 1 ? 1 : progress;
    char line[96];
    std::snprintf(line, sizeof(line), "%cProgress: %zu/%zu %s(s) %.1lf%%", 13,
                  count_, total_, unit_.c_str(), progress * 100);
    out_ << line << std::flush;
  }

  void finalise() {
    if (!quiet_) {
      char line[96];
      std::snprintf(line, sizeof(line), "%cProgress: %zu/%zu %s(s) 100.0%%\n",
                    13, total_, total_, unit_.c_str());
      out_ << line << std::flush;
    }
  }

  size_t count() const { return count_; }

private:
  size_t total_;
  size_t count_;
  std::string unit_;
  std::ostream &out_;
  bool quiet_;
};
