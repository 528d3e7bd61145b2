#pragma once

// Compound types used by many functions in api, bindings etc

#include <cstddef>
#include <string>

#include "robin_hood.h"

// id -> path to the fasta file
using GenomeMap = robin_hood::unordered_map<std::string, std::string>;

// One row of mash dist output
struct DistHit {
  double dist;
  double p_val;
  size_t shared_num;
  size_t shared_den;
};

inline bool operator==(const DistHit &a, const DistHit &b) {
  return a.dist == b.dist && a.p_val == b.p_val &&
         a.shared_num == b.shared_num && a.shared_den == b.shared_den;
}

inline bool operator!=(const DistHit &a, const DistHit &b) { return !(a == b); }

// query -> reference -> hit. Pairs without a hit within the threshold are
// absent, which is not the same as a distance of zero
using RefHits = robin_hood::unordered_map<std::string, DistHit>;
using DistanceMap = robin_hood::unordered_map<std::string, RefHits>;
