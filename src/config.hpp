/*
 *
 * config.hpp
 * Default parameters
 *
 */
#pragma once

#include <cstddef>

const size_t def_mash_k = 16;             // k-mer size
const size_t def_mash_s = 5000;           // hashes kept per sketch
const double def_mash_d = 0.1;            // mash dist -d
const double def_mash_v = 1.0;            // mash dist -v
const double def_mash_max_dist = 0.15;    // filter applied when reading
const double def_read_max_dist = 100;     // keeps everything mash reported
const size_t max_mash_k = 32;
const char *const def_mash_exe = "mash";
const char *const def_prefix = "mashrunner";

// Names of the files written to the output directory, after the prefix
const char *const qry_sketch_name = "user_query_sketch.msh";
const char *const ref_sketch_name = "ref_sketch.msh";
const char *const dist_file_name = "mash_distances.tsv";
const char *const sketch_suffix = ".msh";

const char *const tmp_dir_prefix = "mashrunner_tmp_";
const char *const unknown_version = "unknown";
