/*
 * api.cpp
 * Main functions for running mash
 *
 */

#include <algorithm>
#include <stdexcept>

#include "api.hpp"

#include "config.hpp"
#include "dist/distance_file.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "process/mash_tool.hpp"
#include "sketch/sketch_file.hpp"

namespace {

std::string trim(const std::string &str) {
  const char *whitespace = " \t\r\n";
  const size_t start = str.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  const size_t end = str.find_last_not_of(whitespace);
  return str.substr(start, end - start + 1);
}

using PathLookup = robin_hood::unordered_map<std::string, std::string>;

PathLookup invert(const GenomeMap &genomes) {
  PathLookup path_to_id;
  for (auto genome_it = genomes.cbegin(); genome_it != genomes.cend();
       ++genome_it) {
    path_to_id[genome_it->second] = genome_it->first;
  }
  return path_to_id;
}

} // namespace

MashRunner::MashRunner(ProcessRunner &runner, Logger &logger,
                       const int num_threads, const std::string &out_dir,
                       const std::string &prefix, const std::string &mash_exe)
    : _runner(runner), _logger(logger),
      _num_threads(static_cast<size_t>(std::max(num_threads, 1))),
      _out_dir(out_dir), _prefix(prefix), _mash_exe(mash_exe) {}

DistanceMap MashRunner::run(const GenomeMap &qry, const GenomeMap &ref,
                            const double mash_d, const size_t mash_k,
                            const double mash_v, const size_t mash_s,
                            const double max_mash_dist,
                            const std::string &mash_db) {
  check_genomes(qry, "query");
  check_genomes(ref, "reference");
  if (!mash_db.empty()) {
    // A bad database path must fail before the query is sketched
    normalise_db_path(mash_db);
  }

  MashTool mash(_runner, _logger, _mash_exe);
  QrySketchFile qry_sketch(qry, _out_dir, _prefix, mash, _num_threads, mash_k,
                           mash_s);
  RefSketchFile ref_sketch(ref, _out_dir, _prefix, mash, _num_threads, mash_k,
                           mash_s, mash_db);

  // Generate an output file comparing the distances between these genomes
  DistanceFile mash_dists(qry_sketch, ref_sketch, _out_dir, _prefix, mash,
                          _num_threads, mash_d, mash_v);
  DistanceMap results = mash_dists.read(max_mash_dist);

  return rekey_hits(results, qry, ref);
}

std::string mash_version(ProcessRunner &runner, const std::string &mash_exe) {
  try {
    ProcessResult result = runner.invoke({mash_exe, "--version"});
    std::string version = trim(result.out);
    if (result.exit_code == 0 && !version.empty()) {
      return version;
    }
  } catch (const std::runtime_error &) {
    // Could not start mash at all
  }
  return unknown_version;
}

void check_genomes(const GenomeMap &genomes, const std::string &label) {
  PathLookup path_to_id;
  PathLookup name_to_path;
  for (auto genome_it = genomes.cbegin(); genome_it != genomes.cend();
       ++genome_it) {
    const std::string &path = genome_it->second;
    auto path_found = path_to_id.find(path);
    if (path_found != path_to_id.end()) {
      throw ConfigError("The " + label + " genomes " + path_found->second +
                        " and " + genome_it->first + " have the same path " +
                        path);
    }
    path_to_id[path] = genome_it->first;

    const std::string name = base_name(path);
    auto name_found = name_to_path.find(name);
    if (name_found != name_to_path.end()) {
      throw ConfigError("The " + label + " genome files " +
                        name_found->second + " and " + path +
                        " have the same file name; file names must be "
                        "unique");
    }
    name_to_path[name] = path;
  }
}

DistanceMap rekey_hits(const DistanceMap &results, const GenomeMap &qry,
                       const GenomeMap &ref) {
  // The reference sketch can be moved between filesystems, so hits are
  // matched back to the reference genomes by file name
  PathLookup current_ref;
  for (auto ref_it = ref.cbegin(); ref_it != ref.cend(); ++ref_it) {
    current_ref[base_name(ref_it->second)] = ref_it->second;
  }

  PathLookup path_to_qry = invert(qry);
  PathLookup path_to_ref = invert(ref);

  DistanceMap out;
  for (auto qry_it = results.cbegin(); qry_it != results.cend(); ++qry_it) {
    auto qry_id = path_to_qry.find(qry_it->first);
    if (qry_id == path_to_qry.end()) {
      throw ConfigError("Mash reported a distance for " + qry_it->first +
                        ", which is not one of the query genomes");
    }
    for (auto ref_it = qry_it->second.cbegin();
         ref_it != qry_it->second.cend(); ++ref_it) {
      auto ref_path = current_ref.find(ref_it->first);
      if (ref_path == current_ref.end()) {
        throw ConfigError("Mash reported a distance to " + ref_it->first +
                          ", which is not one of the reference genomes");
      }
      out[qry_id->second][path_to_ref[ref_path->second]] = ref_it->second;
    }
  }
  return out;
}
