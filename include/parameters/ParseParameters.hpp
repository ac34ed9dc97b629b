#pragma once

// Standard
#include <filesystem>

// Boost
#include <boost/program_options/variables_map.hpp>

// Internal
#include "GeneralParameters.hpp"
#include "ParameterValidator.hpp"

namespace pipelines {

namespace po = boost::program_options;

class ParseParameters : public GeneralParameters {
   public:
    std::filesystem::path fastqPath;

    ParseParameters(const po::variables_map& params)
        : GeneralParameters(params),
          fastqPath(ParameterValidator::validateFilePath(params, "fastq")) {}
};

}  // namespace pipelines
