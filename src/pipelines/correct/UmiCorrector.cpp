#include "UmiCorrector.hpp"

// Standard
#include <optional>
#include <utility>

// Internal
#include "CompleteBarcode.hpp"
#include "CustomSamTags.hpp"

namespace pipelines::correct {

auto UmiCorrector::countUmi(BarcodeUmiCounts &counts, const dataTypes::SamRecord &record)
    -> bool {
    const auto barcodeKey = barcodes::completeBarcodeKey(record.tags());
    const auto umi = tags::getString(record.tags(), tags::rawUmi);
    if (!barcodeKey.has_value() || !umi.has_value()) {
        return false;
    }

    ++counts[barcodeKey.value()][umi.value()];
    return true;
}

auto UmiCorrector::buildCorrections(const BarcodeUmiCounts &counts,
                                    const UmiClusterer &clusterer) -> CorrectionMap {
    CorrectionMap corrections;
    corrections.reserve(counts.size());
    for (const auto &[barcodeKey, umiCounts] : counts) {
        corrections.emplace(barcodeKey, clusterer.cluster(umiCounts));
    }
    return corrections;
}

auto UmiCorrector::correct(dataTypes::SamRecord &record) const -> bool {
    const auto barcodeKey = barcodes::completeBarcodeKey(record.tags());
    const auto umi = tags::getString(record.tags(), tags::rawUmi);
    if (!barcodeKey.has_value() || !umi.has_value()) {
        return false;
    }

    const auto barcodeIter = corrections.find(barcodeKey.value());
    if (barcodeIter == corrections.end()) {
        return false;
    }

    const auto umiIter = barcodeIter->second.find(umi.value());
    if (umiIter == barcodeIter->second.end()) {
        return false;
    }

    tags::setString(record.tags(), tags::correctedUmi, umiIter->second);
    return true;
}

}  // namespace pipelines::correct
