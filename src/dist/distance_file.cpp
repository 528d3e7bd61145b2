/*
 *
 * distance_file.cpp
 * Run mash dist and parse its output
 *
 */

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "distance_file.hpp"

#include "config.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "parse_utils.hpp"

namespace {

// Shortest form that reads back as the same value, so mash gets the
// threshold it was given (0.1 rather than 0.100000 or 0.10000000000000001)
std::string format_threshold(const double value) {
  std::string formatted;
  for (int precision = 1; precision <= 17; ++precision) {
    std::ostringstream attempt;
    attempt.precision(precision);
    attempt << value;
    formatted = attempt.str();
    if (std::strtod(formatted.c_str(), nullptr) == value) {
      break;
    }
  }
  return formatted;
}

} // namespace

DistanceFile::DistanceFile(const SketchFile &qry_sketch,
                           const SketchFile &ref_sketch,
                           const std::string &root, const std::string &prefix,
                           const MashTool &mash, const size_t num_threads,
                           const double max_d, const double max_p)
    : _qry_path(qry_sketch.path()), _ref_path(ref_sketch.path()),
      _path(join_path(root, prefix + "." + dist_file_name)),
      _num_threads(num_threads), _max_d(max_d), _max_p(max_p) {
  calculate(mash);
}

void DistanceFile::calculate(const MashTool &mash) {
  mash.logger().info("Calculating Mash distances.");
  make_path(dir_name(_path));

  std::vector<std::string> args = mash.command("dist");
  std::vector<std::string> options = {"-p",
                                      std::to_string(_num_threads),
                                      "-d",
                                      format_threshold(_max_d),
                                      "-v",
                                      format_threshold(_max_p),
                                      _ref_path,
                                      _qry_path};
  args.insert(args.end(), options.begin(), options.end());

  ProcessResult result = mash.runner().invoke(args, _path);
  if (result.exit_code != 0) {
    // Whatever was written is incomplete
    remove_tree(_path);
    throw ToolError("Error running Mash dist (exit code " +
                    std::to_string(result.exit_code) + "): " + result.err);
  }
}

DistanceMap DistanceFile::read(const double max_mash_dist) const {
  return read_distances(_path, max_mash_dist);
}

bool parse_dist_line(const std::string &line, DistRow &row) {
  std::vector<std::string> fields = split_fields(strip_cr(line));
  if (fields.size() != 5 || fields[0].empty() || fields[1].empty()) {
    return false;
  }

  const size_t slash = fields[4].find('/');
  if (slash == std::string::npos) {
    return false;
  }
  DistHit hit;
  if (!parse_real(fields[2], hit.dist) || !parse_real(fields[3], hit.p_val) ||
      !parse_count(fields[4].substr(0, slash), hit.shared_num) ||
      !parse_count(fields[4].substr(slash + 1), hit.shared_den)) {
    return false;
  }
  if (!(hit.dist >= 0 && hit.dist <= 1) || std::isnan(hit.p_val) ||
      hit.shared_num > hit.shared_den) {
    return false;
  }

  row.ref_id = fields[0];
  row.qry_id = fields[1];
  row.hit = hit;
  return true;
}

DistanceMap read_distances(std::istream &dist_in, const double max_mash_dist) {
  DistanceMap hits;
  std::string line;
  DistRow row;
  while (std::getline(dist_in, line)) {
    if (parse_dist_line(line, row) && row.hit.dist <= max_mash_dist) {
      hits[row.qry_id][base_name(row.ref_id)] = row.hit;
    }
  }
  return hits;
}

DistanceMap read_distances(const std::string &dist_path,
                           const double max_mash_dist) {
  std::ifstream dist_in(dist_path);
  if (!dist_in) {
    throw std::runtime_error("Could not open Mash distance file " + dist_path);
  }
  return read_distances(dist_in, max_mash_dist);
}
