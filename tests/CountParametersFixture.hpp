#pragma once

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Boost
#include <boost/program_options.hpp>

// Classes
#include "CountParameters.hpp"
#include "ParameterOptions.hpp"
#include "ParseSamRecords.hpp"

namespace po = boost::program_options;

// Layout and whitelists shared by the stage tests
const std::string testLayout = "N4,GTCA|TCA,N4,GGTT,N3,N3";

/**
 * Builds count parameters from command line style arguments, the whitelists and the STAR
 * reference directory are created inside testDir.
 */
inline pipelines::CountParameters countParameters(const std::filesystem::path& testDir,
                                                  std::vector<std::string> args) {
    std::filesystem::create_directories(testDir / "star_ref");
    std::filesystem::create_directories(testDir / "fastq");
    writeTextFile(testDir / "bc_whitelist.txt", "ACAC\nGTGT\nCAAC\n");
    writeTextFile(testDir / "sbc_whitelist.txt", "AGT\nTCA\n");

    const std::vector<std::string> requiredArgs = {
        "--outdir",      (testDir / "out").string(),
        "--fastqdir",    (testDir / "fastq").string(),
        "--starref",     (testDir / "star_ref").string(),
        "--bcwhitelist", (testDir / "bc_whitelist.txt").string(),
        "--sbcwhitelist", (testDir / "sbc_whitelist.txt").string(),
        "--layout",      testLayout,
        "--maxbcerr",    "1",
        "--maxsbcerr",   "1",
        "--sbcrejectdelta", "0"};
    args.insert(args.begin(), requiredArgs.begin(), requiredArgs.end());

    po::options_description options;
    options.add(ParameterOptions::getGeneralOptions())
        .add(ParameterOptions::getBarcodeOptions())
        .add(ParameterOptions::getCountOptions());

    po::variables_map params;
    po::store(po::command_line_parser(args).options(options).run(), params);
    po::notify(params);

    return pipelines::CountParameters{params};
}
