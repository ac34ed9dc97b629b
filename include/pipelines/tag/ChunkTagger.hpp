#pragma once

// Standard
#include <cstddef>
#include <ostream>
#include <vector>

// Internal
#include "BarcodeConfig.hpp"
#include "BarcodeTagger.hpp"
#include "FastqRecord.hpp"
#include "SamRecord.hpp"

namespace pipelines::tag {

struct TagStatistics {
    size_t processedRecords{0};
    size_t acceptedRecords{0};
    size_t lowScoreRecords{0};
    size_t undecodableBarcodeRecords{0};
    size_t undecodableSampleBarcodeRecords{0};

    void operator+=(const TagStatistics &other) {
        processedRecords += other.processedRecords;
        acceptedRecords += other.acceptedRecords;
        lowScoreRecords += other.lowScoreRecords;
        undecodableBarcodeRecords += other.undecodableBarcodeRecords;
        undecodableSampleBarcodeRecords += other.undecodableSampleBarcodeRecords;
    }

    void count(const barcodes::FilterReason reason);
};

auto operator<<(std::ostream &outputStream, const TagStatistics &statistics) -> std::ostream &;

struct TaggedChunk {
    std::vector<dataTypes::SamRecord> records;
    TagStatistics statistics;
};

/**
 * Tags the aligned records of a chunk with the barcodes decoded from their mates. A fresh tagger
 * is built from the configuration for every chunk; filtered records are dropped and counted.
 */
auto tagRecordPairs(std::vector<dataTypes::RecordPair> chunk, const barcodes::BarcodeConfig &config,
                    const double threshold) -> TaggedChunk;

}  // namespace pipelines::tag
