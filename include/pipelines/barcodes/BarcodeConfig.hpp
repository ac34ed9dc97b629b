#pragma once

// Standard
#include <cstddef>
#include <string>
#include <vector>

// Internal
#include "Layout.hpp"

namespace pipelines::barcodes {

/**
 * Immutable description of the barcode structure of a run. Workers build their own aligner and
 * decoders from it.
 */
struct BarcodeConfig {
    Layout layout;
    std::vector<std::string> barcodeWhitelist;
    std::vector<std::string> sampleBarcodeWhitelist;
    size_t maxBarcodeErrors;
    size_t maxSampleBarcodeErrors;
    size_t sampleBarcodeRejectDelta;

    /**
     * Checks that a layout has the six positional roles expected for tagging: cell barcode,
     * spacer, cell barcode, spacer, sample barcode and UMI, where barcodes and UMI are wildcards
     * and spacers are literals.
     *
     * @throws std::invalid_argument if the layout does not have this shape.
     */
    static void validateLayout(const Layout &layout);
};

}  // namespace pipelines::barcodes
