#include "CountMatrixAssembler.hpp"

// Standard
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

// Internal
#include "CompleteBarcode.hpp"
#include "CustomSamTags.hpp"

namespace pipelines::count {

auto CountMatrixAssembler::add(const dataTypes::SamRecord &record) -> bool {
    if (!record.reference_id().has_value() || record.reference_id().value() < 0) {
        return false;
    }

    const auto barcodeKey = barcodes::completeBarcodeKey(record.tags());
    const auto umi = tags::getString(record.tags(), tags::correctedUmi);
    if (!barcodeKey.has_value() || !umi.has_value()) {
        return false;
    }

    add(static_cast<size_t>(record.reference_id().value()), barcodeKey.value(), umi.value());
    return true;
}

void CountMatrixAssembler::add(size_t referenceIndex, const std::string &barcodeKey,
                               const std::string &umi, uint64_t reads) {
    aggregates[referenceIndex][barcodeKey][umi] += reads;
}

void CountMatrixAssembler::operator+=(const CountMatrixAssembler &other) {
    for (const auto &[referenceIndex, barcodeCounts] : other.aggregates) {
        for (const auto &[barcodeKey, umiReadCounts] : barcodeCounts) {
            for (const auto &[umi, reads] : umiReadCounts) {
                add(referenceIndex, barcodeKey, umi, reads);
            }
        }
    }
}

auto CountMatrixAssembler::assemble(const std::deque<std::string> &referenceLabels) const
    -> CountMatrices {
    std::set<std::string> barcodeKeys;
    for (const auto &[referenceIndex, barcodeCounts] : aggregates) {
        if (referenceIndex >= referenceLabels.size()) {
            throw std::out_of_range("Reference index " + std::to_string(referenceIndex) +
                                    " has no label");
        }
        for (const auto &[barcodeKey, umiReadCounts] : barcodeCounts) {
            barcodeKeys.insert(barcodeKey);
        }
    }

    std::unordered_map<std::string, size_t> barcodeIndices;
    barcodeIndices.reserve(barcodeKeys.size());
    for (const auto &barcodeKey : barcodeKeys) {
        barcodeIndices.emplace(barcodeKey, barcodeIndices.size());
    }

    CountMatrices matrices{
        .referenceLabels = {referenceLabels.begin(), referenceLabels.end()},
        .barcodeLabels = {barcodeKeys.begin(), barcodeKeys.end()},
        .readCounts = CountMatrix(referenceLabels.size(), barcodeKeys.size()),
        .umiCounts = CountMatrix(referenceLabels.size(), barcodeKeys.size())};

    for (const auto &[referenceIndex, barcodeCounts] : aggregates) {
        for (const auto &[barcodeKey, umiReadCounts] : barcodeCounts) {
            const size_t barcodeIndex = barcodeIndices.at(barcodeKey);

            uint64_t reads = 0;
            for (const auto &[umi, umiReads] : umiReadCounts) {
                reads += umiReads;
            }

            matrices.readCounts.add(referenceIndex, barcodeIndex, reads);
            matrices.umiCounts.add(referenceIndex, barcodeIndex, umiReadCounts.size());
        }
    }

    return matrices;
}

}  // namespace pipelines::count
