#include "BarcodeConfig.hpp"

// Standard
#include <sstream>
#include <stdexcept>
#include <string>

// Internal
#include "Constants.hpp"

namespace pipelines::barcodes {

void BarcodeConfig::validateLayout(const Layout &layout) {
    using namespace constants::layout;

    std::ostringstream layoutStream;
    layoutStream << layout;

    if (layout.size() != segmentCount) {
        throw std::invalid_argument("Layout needs " + std::to_string(segmentCount) +
                                    " segments but has " + std::to_string(layout.size()) + ": " +
                                    layoutStream.str());
    }

    for (const size_t segmentIndex :
         {firstCellBarcodeSegment, secondCellBarcodeSegment, sampleBarcodeSegment, umiSegment}) {
        if (!layout.segments[segmentIndex].isWildcard()) {
            throw std::invalid_argument("Layout segment " + std::to_string(segmentIndex + 1) +
                                        " must be a wildcard (N<k>): " + layoutStream.str());
        }
    }

    for (const size_t segmentIndex : {firstFillerSegment, secondFillerSegment}) {
        if (layout.segments[segmentIndex].isWildcard()) {
            throw std::invalid_argument("Layout segment " + std::to_string(segmentIndex + 1) +
                                        " must be a literal spacer: " + layoutStream.str());
        }
    }
}

}  // namespace pipelines::barcodes
