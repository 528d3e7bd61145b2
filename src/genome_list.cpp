/*
 *
 * genome_list.cpp
 * Reading id<TAB>path lists of genomes
 *
 */

#include <fstream>

#include "genome_list.hpp"

#include "errors.hpp"
#include "parse_utils.hpp"

GenomeMap read_genome_list(std::istream &list_in, const std::string &source) {
  GenomeMap genomes;
  std::string line;
  size_t line_nr = 0;
  while (std::getline(list_in, line)) {
    ++line_nr;
    line = strip_cr(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::vector<std::string> fields = split_fields(line);
    if (fields.size() != 2 || fields[0].empty() || fields[1].empty()) {
      throw ConfigError(source + " line " + std::to_string(line_nr) +
                        ": expected genome id and path separated by a tab");
    }
    if (genomes.find(fields[0]) != genomes.end()) {
      throw ConfigError(source + " line " + std::to_string(line_nr) +
                        ": genome " + fields[0] + " is listed more than once");
    }
    genomes[fields[0]] = fields[1];
  }
  return genomes;
}

GenomeMap read_genome_list(const std::string &list_path) {
  std::ifstream list_in(list_path);
  if (!list_in) {
    throw ConfigError("Could not open genome list " + list_path);
  }
  return read_genome_list(list_in, list_path);
}
