/*
 *
 * cli.cpp
 * Command line options, their checks, and the JSON report of hits
 *
 */

#include "cli.hpp"

#include "config.hpp"
#include "errors.hpp"

namespace po = boost::program_options;
using json = nlohmann::json;

void addMainOptions(po::options_description &mainDesc) {
  mainDesc.add_options()
      ("query-list,q", po::value<std::string>(), "Query genomes, id<TAB>path per line (required)")
      ("ref-list,r", po::value<std::string>(), "Reference genomes, id<TAB>path per line (required)")
      ("out-dir,o", po::value<std::string>(), "Directory for sketches and distances (required)")
      ("prefix", po::value<std::string>()->default_value(def_prefix), "Prefix for output files")
      ("cpus,p", po::value<int>()->default_value(1), "Threads for mash")
      ("mash-k", po::value<size_t>()->default_value(def_mash_k), "k-mer size")
      ("mash-s", po::value<size_t>()->default_value(def_mash_s), "Maximum number of non-redundant hashes")
      ("mash-d", po::value<double>()->default_value(def_mash_d), "Maximum distance for mash to report")
      ("mash-v", po::value<double>()->default_value(def_mash_v), "Maximum p-value for mash to report")
      ("mash-max-distance", po::value<double>()->default_value(def_mash_max_dist), "Maximum distance to keep a hit")
      ("mash-db", po::value<std::string>(), "Reference sketch to read, or to write for later runs (.msh)")
      ("mash-exe", po::value<std::string>()->default_value(def_mash_exe), "mash executable")
      ("output", po::value<std::string>(), "Write hits as JSON here (default: stdout)")
      ("quiet", "Only print warnings and errors")
      ("version", "Print version and exit")
      ("help,h", "Print help messages");
}

void checkParameters(const po::variables_map &vm) {
  const char *required[] = {"query-list", "ref-list", "out-dir"};
  for (const char *option : required) {
    if (!vm.count(option)) {
      throw ConfigError(std::string("--") + option + " is required");
    }
  }
  const size_t k = vm["mash-k"].as<size_t>();
  if (k < 1 || k > max_mash_k) {
    throw ConfigError("--mash-k must be between 1 and " +
                      std::to_string(max_mash_k));
  }
  if (vm["mash-s"].as<size_t>() < 1) {
    throw ConfigError("--mash-s must be at least 1");
  }
  const char *distances[] = {"mash-d", "mash-max-distance"};
  for (const char *option : distances) {
    const double d = vm[option].as<double>();
    if (!(d >= 0 && d <= 1)) {
      throw ConfigError(std::string("--") + option +
                        " must be between 0 and 1");
    }
  }
  if (!(vm["mash-v"].as<double>() >= 0)) {
    throw ConfigError("--mash-v must not be negative");
  }
}

json hitsToJson(const DistanceMap &hits) {
  json hits_json = json::object();
  for (auto qry_it = hits.cbegin(); qry_it != hits.cend(); ++qry_it) {
    json ref_json = json::object();
    for (auto ref_it = qry_it->second.cbegin();
         ref_it != qry_it->second.cend(); ++ref_it) {
      ref_json[ref_it->first] = {{"dist", ref_it->second.dist},
                                 {"p_value", ref_it->second.p_val},
                                 {"shared_num", ref_it->second.shared_num},
                                 {"shared_den", ref_it->second.shared_den}};
    }
    hits_json[qry_it->first] = ref_json;
  }
  return hits_json;
}

std::string hitsReport(const DistanceMap &hits) {
  return hitsToJson(hits).dump(2, ' ', false, json::error_handler_t::replace);
}
