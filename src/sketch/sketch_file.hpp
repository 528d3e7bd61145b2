/*
 *
 * sketch_file.hpp
 * mash sketch files, generated or reused from disk
 *
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "robin_hood.h"

#include "dist/dist_types.hpp"
#include "process/mash_tool.hpp"

struct SketchEntry {
  size_t hashes;
  size_t length;
};

// path used to make the sketch -> contents, as listed by mash info
using SketchInfo = robin_hood::unordered_map<std::string, SketchEntry>;

enum class SketchOrigin { Generated, Cached };

class SketchFile {
public:
  SketchFile(const GenomeMap &genomes, const std::string &path,
             const MashTool &mash, const size_t num_threads,
             const size_t kmer_size, const size_t sketch_size);
  virtual ~SketchFile() {}

  const std::string &path() const { return _path; }
  const GenomeMap &genomes() const { return _genomes; }
  SketchOrigin origin() const { return _origin; }
  // Empty for a sketch generated in this run
  const SketchInfo &data() const { return _data; }

private:
  void generate();

  GenomeMap _genomes;
  std::string _path;
  MashTool _mash;
  size_t _num_threads;
  size_t _kmer_size;
  size_t _sketch_size;
  SketchOrigin _origin;
  SketchInfo _data;
};

// Query genomes, always written to the output directory
class QrySketchFile : public SketchFile {
public:
  QrySketchFile(const GenomeMap &genomes, const std::string &root,
                const std::string &prefix, const MashTool &mash,
                const size_t num_threads, const size_t kmer_size,
                const size_t sketch_size);
};

// Reference genomes, optionally kept at mash_db to be reused by later runs
class RefSketchFile : public SketchFile {
public:
  RefSketchFile(const GenomeMap &genomes, const std::string &root,
                const std::string &prefix, const MashTool &mash,
                const size_t num_threads, const size_t kmer_size,
                const size_t sketch_size, const std::string &mash_db = "");
};

// Runs mash info -t on an existing sketch
SketchInfo load_sketch_info(const MashTool &mash, const std::string &path);
// Parses the output of mash info -t, skipping the header
SketchInfo parse_sketch_info(const std::string &info_out);

// True if the sketch holds the same file names as the genomes. Directories are
// not compared, as sketches may have been moved since they were made
bool sketch_consistent(const SketchInfo &sketch, const GenomeMap &genomes);

// Strips trailing separators and adds .msh if missing. Throws ConfigError if
// the result is a directory
std::string normalise_db_path(const std::string &mash_db);
