/*
 *
 * cli.hpp
 * Command line options, their checks, and the JSON report of hits
 *
 */
#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "dist/dist_types.hpp"

void addMainOptions(boost::program_options::options_description &mainDesc);

// Throws ConfigError for a missing or out of range option
void checkParameters(const boost::program_options::variables_map &vm);

nlohmann::json hitsToJson(const DistanceMap &hits);

// Indented JSON. Bytes in ids that are not UTF-8 are replaced, not fatal
std::string hitsReport(const DistanceMap &hits);
