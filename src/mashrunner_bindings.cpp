/*
 * mashrunner_bindings.cpp
 * Python bindings for mashrunner
 *
 */

#include <map>
#include <tuple>

// pybind11 headers
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

#include "api.hpp"
#include "config.hpp"
#include "dist/distance_file.hpp"
#include "errors.hpp"
#include "process/mash_tool.hpp"
#include "sketch/sketch_file.hpp"
#include "version.h"

using PyHit = std::tuple<double, double, size_t, size_t>;
using PyHits = std::map<std::string, std::map<std::string, PyHit>>;

GenomeMap toGenomeMap(const std::map<std::string, std::string> &genomes) {
  GenomeMap converted;
  for (auto genome_it = genomes.cbegin(); genome_it != genomes.cend();
       ++genome_it) {
    converted[genome_it->first] = genome_it->second;
  }
  return converted;
}

PyHits toPyHits(const DistanceMap &hits) {
  PyHits converted;
  for (auto qry_it = hits.cbegin(); qry_it != hits.cend(); ++qry_it) {
    std::map<std::string, PyHit> &ref_hits = converted[qry_it->first];
    for (auto ref_it = qry_it->second.cbegin();
         ref_it != qry_it->second.cend(); ++ref_it) {
      const DistHit &hit = ref_it->second;
      ref_hits[ref_it->first] =
          std::make_tuple(hit.dist, hit.p_val, hit.shared_num, hit.shared_den);
    }
  }
  return converted;
}

PyHits runMash(const std::map<std::string, std::string> &qry,
               const std::map<std::string, std::string> &ref,
               const std::string &out_dir, const std::string &prefix,
               const double mash_d, const size_t mash_k, const double mash_v,
               const size_t mash_s, const double mash_max_dist,
               const std::string &mash_db, const int num_threads,
               const std::string &mash_exe, const bool quiet) {
  PosixProcessRunner runner;
  Logger logger(std::cerr, quiet);
  MashRunner mash(runner, logger, num_threads, out_dir, prefix, mash_exe);
  DistanceMap hits = mash.run(toGenomeMap(qry), toGenomeMap(ref), mash_d,
                              mash_k, mash_v, mash_s, mash_max_dist, mash_db);
  return toPyHits(hits);
}

std::string mashVersion(const std::string &mash_exe) {
  PosixProcessRunner runner;
  return mash_version(runner, mash_exe);
}

std::map<std::string, std::tuple<size_t, size_t>>
sketchInfo(const std::string &sketch_path, const std::string &mash_exe) {
  PosixProcessRunner runner;
  Logger logger(std::cerr, true);
  MashTool mash(runner, logger, mash_exe);
  SketchInfo info = load_sketch_info(mash, sketch_path);

  std::map<std::string, std::tuple<size_t, size_t>> converted;
  for (auto info_it = info.cbegin(); info_it != info.cend(); ++info_it) {
    converted[info_it->first] =
        std::make_tuple(info_it->second.hashes, info_it->second.length);
  }
  return converted;
}

PyHits readDistances(const std::string &dist_path,
                     const double max_mash_dist) {
  return toPyHits(read_distances(dist_path, max_mash_dist));
}

PYBIND11_MODULE(mashrunner, m) {
  m.doc() = "Mash distances between query and reference genomes";

  // Exported functions
  m.def("run", &runMash,
        "Sketch genomes, run mash dist and return "
        "hits[query_id][ref_id] = (dist, p_val, shared_num, shared_den)",
        py::arg("query"), py::arg("ref"), py::arg("out_dir"),
        py::arg("prefix") = std::string(def_prefix),
        py::arg("mash_d") = def_mash_d, py::arg("mash_k") = def_mash_k,
        py::arg("mash_v") = def_mash_v, py::arg("mash_s") = def_mash_s,
        py::arg("mash_max_dist") = def_mash_max_dist,
        py::arg("mash_db") = std::string(), py::arg("num_threads") = 1,
        py::arg("mash_exe") = std::string(def_mash_exe),
        py::arg("quiet") = false);

  m.def("mashVersion", &mashVersion,
        "Version of mash, or 'unknown' if it cannot be run",
        py::arg("mash_exe") = std::string(def_mash_exe));

  m.def("sketchInfo", &sketchInfo,
        "Hash count and length of each genome in a mash sketch",
        py::arg("sketch_path"),
        py::arg("mash_exe") = std::string(def_mash_exe));

  m.def("readDistances", &readDistances,
        "Parse a file written by mash dist, keeping hits within "
        "mash_max_dist",
        py::arg("dist_path"), py::arg("mash_max_dist") = def_read_max_dist);

  m.attr("version") = MASHRUNNER_VERSION;

  // Exceptions
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_RuntimeError);
  py::register_exception<ToolError>(m, "ToolError", PyExc_RuntimeError);
}
