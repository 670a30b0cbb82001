#pragma once
/// @file ProductCli.hpp
/// @brief Command-line front end over the product catalog

#include <iosfwd>
#include <string>
#include <vector>

namespace SkuMaster::cli {

/// @brief Environment variable naming the data file when --file is not given
constexpr const char* kDataFileEnv = "SKUMASTER_DATA_FILE";

/// @brief Parsed global options and the remaining command words
struct Options {
    std::string dataFile;
    std::vector<std::string> command;
    bool help = false;
};

/// @brief Data file from, in order: @p cliValue, $SKUMASTER_DATA_FILE, build default
std::string resolveDataFile(const std::string& cliValue);

/// @brief Split global options (--file/-f, --help/-h) from the command words
/// @param[out] error Message for a malformed option
/// @return false on a usage error
bool parseOptions(const std::vector<std::string>& args, Options& opts, std::string& error);

void printUsage(std::ostream& out);

/// @brief Run one command
/// @param args Arguments without the program name
/// @return 0 success, 1 operation failure, 2 usage error
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace SkuMaster::cli
