/*
 * File: sketch_file.cpp
 *
 * Create mash sketches, or check and reuse ones already on disk
 *
 */

#include <fstream>
#include <stdexcept>

#include "sketch_file.hpp"

#include "config.hpp"
#include "errors.hpp"
#include "files.hpp"
#include "parse_utils.hpp"
#include "sketch/progress.hpp"

namespace {

const char *const sketching_marker = "Sketching";

std::string ref_sketch_path(const std::string &root, const std::string &prefix,
                            const std::string &mash_db) {
  if (mash_db.empty()) {
    return join_path(root, prefix + "." + ref_sketch_name);
  }
  std::string db_path = normalise_db_path(mash_db);
  make_path(dir_name(db_path));
  return db_path;
}

bool ends_with(const std::string &str, const std::string &suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

SketchFile::SketchFile(const GenomeMap &genomes, const std::string &path,
                       const MashTool &mash, const size_t num_threads,
                       const size_t kmer_size, const size_t sketch_size)
    : _genomes(genomes), _path(path), _mash(mash), _num_threads(num_threads),
      _kmer_size(kmer_size), _sketch_size(sketch_size),
      _origin(SketchOrigin::Generated) {
  make_path(dir_name(_path));

  // Use the pre-existing sketch file, otherwise generate it
  if (file_exists(_path)) {
    _mash.logger().info("Loading data from existing Mash sketch file: " +
                        _path);
    _data = load_sketch_info(_mash, _path);
    if (!sketch_consistent(_data, _genomes)) {
      throw ConfigError("The sketch file " + _path +
                        " is not consistent with the input genomes. Remove "
                        "the existing sketch file or specify a new output "
                        "directory.");
    }
    _origin = SketchOrigin::Cached;
  } else {
    _mash.logger().info("Creating Mash sketch file: " + _path);
    generate();
  }
}

void SketchFile::generate() {
  TempDir tmp_dir(tmp_dir_prefix);
  const std::string manifest = join_path(tmp_dir.path(), "genomes.txt");
  {
    std::ofstream manifest_out(manifest);
    for (auto genome_it = _genomes.cbegin(); genome_it != _genomes.cend();
         ++genome_it) {
      manifest_out << genome_it->second << '\n';
    }
    manifest_out.close();
    if (!manifest_out) {
      throw std::runtime_error("Could not write genome list to " + manifest);
    }
  }

  std::vector<std::string> args = _mash.command("sketch");
  std::vector<std::string> options = {"-l",
                                      "-p",
                                      std::to_string(_num_threads),
                                      manifest,
                                      "-o",
                                      _path,
                                      "-k",
                                      std::to_string(_kmer_size),
                                      "-s",
                                      std::to_string(_sketch_size)};
  args.insert(args.end(), options.begin(), options.end());

  Logger &logger = _mash.logger();
  ProgressMeter sketch_progress(_genomes.size(), "genome", logger.stream(),
                                logger.quiet());
  ProcessResult result = _mash.runner().invoke(
      args, "", [&sketch_progress](const std::string &line) {
        if (line.compare(0, std::string(sketching_marker).size(),
                         sketching_marker) == 0) {
          sketch_progress.tick(1);
        }
      });
  sketch_progress.finalise();

  if (result.exit_code != 0 || !file_exists(_path)) {
    // Do not leave a half written sketch to be picked up next time
    remove_tree(_path);
    throw ToolError("Error generating Mash sketch (" + format_command(args) +
                    ", exit code " + std::to_string(result.exit_code) +
                    "): " + result.err);
  }
}

QrySketchFile::QrySketchFile(const GenomeMap &genomes, const std::string &root,
                             const std::string &prefix, const MashTool &mash,
                             const size_t num_threads, const size_t kmer_size,
                             const size_t sketch_size)
    : SketchFile(genomes, join_path(root, prefix + "." + qry_sketch_name), mash,
                 num_threads, kmer_size, sketch_size) {}

RefSketchFile::RefSketchFile(const GenomeMap &genomes, const std::string &root,
                             const std::string &prefix, const MashTool &mash,
                             const size_t num_threads, const size_t kmer_size,
                             const size_t sketch_size,
                             const std::string &mash_db)
    : SketchFile(genomes, ref_sketch_path(root, prefix, mash_db), mash,
                 num_threads, kmer_size, sketch_size) {}

SketchInfo load_sketch_info(const MashTool &mash, const std::string &path) {
  std::vector<std::string> args = mash.command("info");
  args.push_back("-t");
  args.push_back(path);
  ProcessResult result = mash.runner().invoke(args);
  if (result.exit_code != 0) {
    throw ToolError("Error reading Mash sketch file " + path + ":\n" +
                    result.err);
  }
  return parse_sketch_info(result.out);
}

SketchInfo parse_sketch_info(const std::string &info_out) {
  SketchInfo sketch;
  std::vector<std::string> lines = split_fields(info_out, '\n');
  for (auto line_it = lines.cbegin(); line_it != lines.cend(); ++line_it) {
    // hashes, length, ID, comment (which may be empty)
    std::vector<std::string> fields = split_fields(strip_cr(*line_it));
    if (fields.size() < 3 || fields[2].empty()) {
      continue;
    }
    SketchEntry entry;
    if (parse_count(fields[0], entry.hashes) &&
        parse_count(fields[1], entry.length)) {
      sketch[fields[2]] = entry;
    }
  }
  return sketch;
}

bool sketch_consistent(const SketchInfo &sketch, const GenomeMap &genomes) {
  robin_hood::unordered_set<std::string> sketch_names;
  for (auto sketch_it = sketch.cbegin(); sketch_it != sketch.cend();
       ++sketch_it) {
    sketch_names.insert(base_name(sketch_it->first));
  }
  robin_hood::unordered_set<std::string> genome_names;
  for (auto genome_it = genomes.cbegin(); genome_it != genomes.cend();
       ++genome_it) {
    genome_names.insert(base_name(genome_it->second));
  }
  if (sketch_names.size() != genome_names.size()) {
    return false;
  }
  for (auto name_it = genome_names.cbegin(); name_it != genome_names.cend();
       ++name_it) {
    if (sketch_names.find(*name_it) == sketch_names.end()) {
      return false;
    }
  }
  return true;
}

std::string normalise_db_path(const std::string &mash_db) {
  std::string db_path = mash_db;
  while (db_path.size() > 1 &&
         (db_path.back() == '/' || db_path.back() == '\\')) {
    db_path.pop_back();
  }
  if (!ends_with(db_path, sketch_suffix)) {
    db_path += sketch_suffix;
  }
  if (is_directory(db_path)) {
    throw ConfigError(db_path + " is a directory");
  }
  return db_path;
}
