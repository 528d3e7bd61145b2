/*
 *
 * genome_list.hpp
 * Reading id<TAB>path lists of genomes
 *
 */
#pragma once

#include <istream>
#include <string>

#include "dist/dist_types.hpp"

// One genome per line as id<TAB>path. Blank lines and lines starting with #
// are skipped. Throws ConfigError on malformed lines or repeated ids
GenomeMap read_genome_list(std::istream &list_in, const std::string &source);
GenomeMap read_genome_list(const std::string &list_path);
