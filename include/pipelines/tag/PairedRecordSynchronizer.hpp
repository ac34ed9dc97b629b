#pragma once

// Standard
#include <cstddef>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Internal
#include "FastqRecord.hpp"
#include "SamRecord.hpp"

namespace pipelines::tag {

/**
 * True if two read identifiers name the same read pair: the first whitespace separated token of
 * both identifiers is equal once a trailing "/1" or "/2" is removed.
 */
auto namesPair(std::string_view barcodeName, std::string_view alignedName) -> bool;

/**
 * Pairs aligned records with the barcode reads of their mates. The aligner may drop reads but
 * keeps their order, so for every aligned record the barcode stream is scanned forward until the
 * matching read is found; skipped barcode reads are never revisited.
 */
template <std::ranges::input_range BarcodeRange, std::ranges::input_range AlignedRange>
class PairedRecordSynchronizer {
   public:
    /**
     * @param maxScanDistance Maximum number of barcode reads skipped for a single aligned record,
     * 0 disables the bound.
     */
    PairedRecordSynchronizer(BarcodeRange &barcodeRecords, AlignedRange &alignedRecords,
                             const size_t maxScanDistance)
        : barcodeIterator(std::ranges::begin(barcodeRecords)),
          barcodeEnd(std::ranges::end(barcodeRecords)),
          alignedIterator(std::ranges::begin(alignedRecords)),
          alignedEnd(std::ranges::end(alignedRecords)),
          maxScanDistance(maxScanDistance) {}

    /**
     * @return The next synchronized pair or std::nullopt once all aligned records are paired.
     * @throws std::runtime_error if the barcode stream holds no mate for an aligned record.
     */
    auto next() -> std::optional<dataTypes::RecordPair> {
        if (alignedIterator == alignedEnd) {
            return std::nullopt;
        }

        const std::string alignedName = (*alignedIterator).id();

        size_t scanned = 0;
        while (barcodeIterator != barcodeEnd) {
            if (namesPair((*barcodeIterator).id(), alignedName)) {
                dataTypes::RecordPair pair{.barcodeRecord = std::move(*barcodeIterator),
                                           .alignedRecord = std::move(*alignedIterator)};
                ++barcodeIterator;
                ++alignedIterator;
                ++pairedCount;
                return pair;
            }

            ++barcodeIterator;
            ++skippedCount;

            if (maxScanDistance > 0 && ++scanned > maxScanDistance) {
                throw std::runtime_error("No barcode read within " +
                                         std::to_string(maxScanDistance) +
                                         " records for aligned read: " + alignedName);
            }
        }

        throw std::runtime_error("Barcode reads exhausted before finding the mate of aligned read: " +
                                 alignedName);
    }

    auto getPairedCount() const -> size_t { return pairedCount; }
    auto getSkippedCount() const -> size_t { return skippedCount; }

   private:
    std::ranges::iterator_t<BarcodeRange> barcodeIterator;
    std::ranges::sentinel_t<BarcodeRange> barcodeEnd;
    std::ranges::iterator_t<AlignedRange> alignedIterator;
    std::ranges::sentinel_t<AlignedRange> alignedEnd;
    const size_t maxScanDistance;

    size_t pairedCount{0};
    size_t skippedCount{0};
};

}  // namespace pipelines::tag
