#include "ChunkTagger.hpp"

// Internal
#include "VariantOverload.hpp"

namespace pipelines::tag {

void TagStatistics::count(const barcodes::FilterReason reason) {
    switch (reason) {
        case barcodes::FilterReason::LOW_SCORE:
            ++lowScoreRecords;
            break;
        case barcodes::FilterReason::UNDECODABLE_BARCODE:
            ++undecodableBarcodeRecords;
            break;
        case barcodes::FilterReason::UNDECODABLE_SAMPLE_BARCODE:
            ++undecodableSampleBarcodeRecords;
            break;
    }
}

auto operator<<(std::ostream &outputStream, const TagStatistics &statistics) -> std::ostream & {
    outputStream << statistics.processedRecords << " processed, " << statistics.acceptedRecords
                 << " accepted, " << statistics.lowScoreRecords << " low score, "
                 << statistics.undecodableBarcodeRecords << " undecodable barcode, "
                 << statistics.undecodableSampleBarcodeRecords << " undecodable sample barcode";
    return outputStream;
}

auto tagRecordPairs(std::vector<dataTypes::RecordPair> chunk, const barcodes::BarcodeConfig &config,
                    const double threshold) -> TaggedChunk {
    barcodes::BarcodeTagger tagger(config);

    TaggedChunk taggedChunk;
    taggedChunk.records.reserve(chunk.size());

    for (auto &pair : chunk) {
        ++taggedChunk.statistics.processedRecords;

        const barcodes::TaggingOutcome outcome =
            tagger.process(pair.barcodeRecord.sequence(), threshold);

        std::visit(overloaded{[&](const barcodes::BarcodeTags &tags) {
                                  tags.applyTo(pair.alignedRecord.tags());
                                  taggedChunk.records.push_back(std::move(pair.alignedRecord));
                                  ++taggedChunk.statistics.acceptedRecords;
                              },
                              [&](const barcodes::FilterReason reason) {
                                  taggedChunk.statistics.count(reason);
                              }},
                   outcome);
    }

    return taggedChunk;
}

}  // namespace pipelines::tag
