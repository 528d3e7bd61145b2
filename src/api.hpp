/*
 *
 * api.hpp
 * main functions for running mash against genomes
 *
 */
#pragma once

#include <cstddef>
#include <string>

#include "dist/dist_types.hpp"
#include "logger.hpp"
#include "process/process.hpp"

class MashRunner {
public:
  // num_threads below 1 are raised to 1
  MashRunner(ProcessRunner &runner, Logger &logger, const int num_threads,
             const std::string &out_dir, const std::string &prefix,
             const std::string &mash_exe = "mash");

  /*
   * Sketches query and reference genomes (reusing sketches already on disk),
   * runs mash dist and returns out[query_id][ref_id] for every hit with
   * distance <= max_mash_dist.
   *
   * mash_d and mash_v are passed to mash dist as -d and -v, so are applied
   * by mash itself. mash_db, if not empty, is where the reference sketch is
   * read from or written to.
   */
  DistanceMap run(const GenomeMap &qry, const GenomeMap &ref,
                  const double mash_d, const size_t mash_k,
                  const double mash_v, const size_t mash_s,
                  const double max_mash_dist,
                  const std::string &mash_db = "");

  size_t num_threads() const { return _num_threads; }

private:
  ProcessRunner &_runner;
  Logger &_logger;
  size_t _num_threads;
  std::string _out_dir;
  std::string _prefix;
  std::string _mash_exe;
};

// mash --version, or "unknown" if mash could not be run. Never throws
std::string mash_version(ProcessRunner &runner,
                         const std::string &mash_exe = "mash");

// Throws ConfigError unless every path, and every file name, is used by only
// one genome
void check_genomes(const GenomeMap &genomes, const std::string &label);

// Converts hits keyed by query path and reference file name (as read from
// the distance file) to the ids used in qry and ref. Reference paths are
// matched on file name, as the reference sketch may have been made elsewhere
DistanceMap rekey_hits(const DistanceMap &results, const GenomeMap &qry,
                       const GenomeMap &ref);
