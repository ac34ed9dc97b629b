#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Layout.hpp"
#include "Logger.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;

class GeneralParameters {
   public:
    std::filesystem::path outputDir;

    LogLevel logLevel;

    size_t threadCount;
    size_t chunkSize;

    pipelines::barcodes::Layout layout;

    GeneralParameters(const po::variables_map& params)
        : outputDir(ParameterValidator::validateOutputDirectory(params, "outdir")),
          logLevel(validateLogLevel(params)),
          threadCount(ParameterValidator::validateArithmetic(params, "threads", size_t{1},
                                                             size_t{UINT16_MAX})),
          chunkSize(ParameterValidator::validateArithmetic(params, "chunksize", size_t{1},
                                                           SIZE_MAX)),
          layout(validateLayout(params)) {};

   private:
    static auto validateLogLevel(const po::variables_map& params) -> LogLevel {
        const std::string logLevelStr = ParameterValidator::validateString(params, "loglevel");

        const auto level = Logger::parseLogLevel(logLevelStr);
        if (!level.has_value()) {
            Logger::log(LogLevel::ERROR, "Invalid log level specified: ", logLevelStr);
            return LogLevel::INFO;
        }
        return level.value();
    }

    static auto validateLayout(const po::variables_map& params) -> pipelines::barcodes::Layout {
        const std::string layoutStr = ParameterValidator::validateString(params, "layout");

        try {
            return pipelines::barcodes::Layout::parse(layoutStr);
        } catch (const std::invalid_argument& e) {
            Logger::log(LogLevel::ERROR, "Check parameter 'layout': ", std::string(e.what()));
            exit(EXIT_FAILURE);
        }
    }
};
