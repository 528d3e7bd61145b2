/*
 *
 * main.cpp
 * mashrunner command line: mash distances between query and reference
 * genomes
 *
 */

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include "api.hpp"
#include "cli.hpp"
#include "errors.hpp"
#include "genome_list.hpp"
#include "logger.hpp"
#include "process/process.hpp"
#include "version.h"

namespace po = boost::program_options;

int main(int argc, char *argv[]) {
  po::options_description mainDesc("mashrunner options");
  addMainOptions(mainDesc);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(mainDesc).run(), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << std::endl << mainDesc << std::endl;
    return 1;
  }
  if (vm.count("help")) {
    std::cout << mainDesc << std::endl;
    return 0;
  }

  PosixProcessRunner runner;
  if (vm.count("version")) {
    std::cout << "mashrunner " << MASHRUNNER_VERSION << std::endl
              << "mash "
              << mash_version(runner, vm["mash-exe"].as<std::string>())
              << std::endl;
    return 0;
  }

  Logger logger(std::cerr, vm.count("quiet") > 0);
  try {
    checkParameters(vm);

    GenomeMap qry = read_genome_list(vm["query-list"].as<std::string>());
    GenomeMap ref = read_genome_list(vm["ref-list"].as<std::string>());
    if (qry.empty() || ref.empty()) {
      throw ConfigError("Both genome lists must contain at least one genome");
    }
    logger.info("Comparing " + std::to_string(qry.size()) +
                " query genome(s) against " + std::to_string(ref.size()) +
                " reference genome(s)");

    MashRunner mash(runner, logger, vm["cpus"].as<int>(),
                    vm["out-dir"].as<std::string>(),
                    vm["prefix"].as<std::string>(),
                    vm["mash-exe"].as<std::string>());
    std::string mash_db;
    if (vm.count("mash-db")) {
      mash_db = vm["mash-db"].as<std::string>();
    }
    DistanceMap hits = mash.run(
        qry, ref, vm["mash-d"].as<double>(), vm["mash-k"].as<size_t>(),
        vm["mash-v"].as<double>(), vm["mash-s"].as<size_t>(),
        vm["mash-max-distance"].as<double>(), mash_db);

    size_t n_hits = 0;
    for (auto qry_it = hits.cbegin(); qry_it != hits.cend(); ++qry_it) {
      n_hits += qry_it->second.size();
    }
    logger.info("Found " + std::to_string(n_hits) + " hit(s) for " +
                std::to_string(hits.size()) + " query genome(s)");
    if (hits.size() < qry.size()) {
      logger.warn(std::to_string(qry.size() - hits.size()) +
                  " query genome(s) had no hits within the distance limits");
    }

    const std::string report = hitsReport(hits);
    if (vm.count("output")) {
      const std::string out_path = vm["output"].as<std::string>();
      std::ofstream json_out(out_path);
      json_out << report << std::endl;
      if (!json_out) {
        throw std::runtime_error("Could not write " + out_path);
      }
    } else {
      std::cout << report << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
