/*
 *
 * distance_file.hpp
 * Output of mash dist and how to read it
 *
 */
#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include "dist_types.hpp"
#include "process/mash_tool.hpp"
#include "sketch/sketch_file.hpp"

// One parsed line of mash dist output, IDs as mash printed them
struct DistRow {
  std::string ref_id;
  std::string qry_id;
  DistHit hit;
};

// Runs mash dist (reference sketch first, query second) on construction
class DistanceFile {
public:
  DistanceFile(const SketchFile &qry_sketch, const SketchFile &ref_sketch,
               const std::string &root, const std::string &prefix,
               const MashTool &mash, const size_t num_threads,
               const double max_d, const double max_p);

  // result[query][basename(reference)] for hits with dist <= max_mash_dist
  DistanceMap read(const double max_mash_dist = 100) const;

  const std::string &path() const { return _path; }

private:
  void calculate(const MashTool &mash);

  std::string _qry_path;
  std::string _ref_path;
  std::string _path;
  size_t _num_threads;
  double _max_d;
  double _max_p;
};

// Returns false for anything that is not
// ref<TAB>query<TAB>dist<TAB>p-value<TAB>shared/total
// with 0 <= dist <= 1 and shared <= total
bool parse_dist_line(const std::string &line, DistRow &row);

DistanceMap read_distances(std::istream &dist_in, const double max_mash_dist);
DistanceMap read_distances(const std::string &dist_path,
                           const double max_mash_dist);
