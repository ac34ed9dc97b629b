#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Boost
#include <boost/program_options/variables_map.hpp>

// Internal
#include "BarcodeConfig.hpp"
#include "BarcodeDecoder.hpp"
#include "GeneralParameters.hpp"
#include "ParameterValidator.hpp"

namespace pipelines {

namespace po = boost::program_options;

class CountParameters : public GeneralParameters {
   public:
    std::filesystem::path fastqDir;
    std::filesystem::path starReferenceDir;
    std::filesystem::path starExecutable;

    std::filesystem::path barcodeWhitelistPath;
    std::filesystem::path sampleBarcodeWhitelistPath;

    size_t maxBarcodeErrors;
    size_t maxSampleBarcodeErrors;
    size_t sampleBarcodeRejectDelta;

    size_t thresholdSampleSize;
    size_t maxScanDistance;

    CountParameters(const po::variables_map& params)
        : GeneralParameters(params),
          fastqDir(ParameterValidator::validateDirectory(params, "fastqdir")),
          starReferenceDir(ParameterValidator::validateDirectory(params, "starref")),
          starExecutable(ParameterValidator::validateString(params, "star")),
          barcodeWhitelistPath(ParameterValidator::validateFilePath(params, "bcwhitelist")),
          sampleBarcodeWhitelistPath(ParameterValidator::validateFilePath(params, "sbcwhitelist")),
          maxBarcodeErrors(
              ParameterValidator::validateArithmetic(params, "maxbcerr", size_t{0}, SIZE_MAX)),
          maxSampleBarcodeErrors(
              ParameterValidator::validateArithmetic(params, "maxsbcerr", size_t{0}, SIZE_MAX)),
          sampleBarcodeRejectDelta(ParameterValidator::validateArithmetic(
              params, "sbcrejectdelta", size_t{0}, SIZE_MAX)),
          thresholdSampleSize(ParameterValidator::validateArithmetic(params, "thresholdsample",
                                                                     size_t{1}, SIZE_MAX)),
          maxScanDistance(
              ParameterValidator::validateArithmetic(params, "maxscan", size_t{0}, SIZE_MAX)) {
        try {
            barcodes::BarcodeConfig::validateLayout(layout);
        } catch (const std::invalid_argument& e) {
            Logger::log(LogLevel::ERROR, "Check parameter 'layout': ", std::string(e.what()));
        }
    }

    /**
     * Loads the whitelists and bundles everything a worker needs to tag barcode reads.
     */
    auto barcodeConfig() const -> barcodes::BarcodeConfig {
        return barcodes::BarcodeConfig{
            .layout = layout,
            .barcodeWhitelist = barcodes::BarcodeDecoder::loadWhitelist(barcodeWhitelistPath),
            .sampleBarcodeWhitelist =
                barcodes::BarcodeDecoder::loadWhitelist(sampleBarcodeWhitelistPath),
            .maxBarcodeErrors = maxBarcodeErrors,
            .maxSampleBarcodeErrors = maxSampleBarcodeErrors,
            .sampleBarcodeRejectDelta = sampleBarcodeRejectDelta};
    }
};

}  // namespace pipelines
