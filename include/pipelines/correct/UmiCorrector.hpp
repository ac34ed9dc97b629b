#pragma once

// Standard
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

// Internal
#include "SamRecord.hpp"
#include "UmiClusterer.hpp"

namespace pipelines::correct {

using BarcodeUmiCounts = std::map<std::string, UmiCounts>;
using CorrectionMap = std::unordered_map<std::string, UmiMapping>;

/**
 * Rewrites the raw UMI (UR) of the records of one reference to the UMI of its molecule (UB),
 * using a mapping built per complete barcode from the UMI counts of that reference.
 */
class UmiCorrector {
   public:
    explicit UmiCorrector(CorrectionMap corrections) : corrections(std::move(corrections)) {}

    /**
     * Counts a record under its complete barcode and raw UMI.
     *
     * @return false if the record lacks a complete barcode or UMI and was not counted.
     */
    static auto countUmi(BarcodeUmiCounts &counts, const dataTypes::SamRecord &record) -> bool;

    static auto buildCorrections(const BarcodeUmiCounts &counts, const UmiClusterer &clusterer)
        -> CorrectionMap;

    /**
     * Sets the UB tag of a record.
     *
     * @return false if the record carries no UMI or no correction is known for it.
     */
    auto correct(dataTypes::SamRecord &record) const -> bool;

   private:
    CorrectionMap corrections;
};

}  // namespace pipelines::correct
