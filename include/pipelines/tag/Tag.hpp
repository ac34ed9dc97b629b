#pragma once

// Standard
#include <cstddef>
#include <deque>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "BarcodeConfig.hpp"
#include "ChunkTagger.hpp"
#include "CountData.hpp"
#include "CountParameters.hpp"
#include "FastqRecord.hpp"
#include "Layout.hpp"

namespace pipelines::tag {

namespace fs = std::filesystem;

/**
 * Tags the STAR alignments of all read pairs with the barcodes of their mates and writes the
 * accepted records, in input order, to a single BAM file.
 */
class Tag {
   public:
    explicit Tag(CountParameters params) : parameters(std::move(params)) {};
    ~Tag() = default;

    void process(const CountData &data) const;

    /**
     * Estimates the score threshold from the barcode reads of synchronized pairs, so reads the
     * aligner dropped never take part. The reads are scored in parallel by threadCount
     * independent aligners.
     */
    static auto estimateThreshold(const std::vector<dataTypes::RecordPair> &sampledPairs,
                                  const barcodes::Layout &layout, size_t threadCount) -> double;

    /**
     * Scores the barcode reads of pairs with one aligner per slice, keeping the order of the input.
     */
    static auto scoreInParallel(const std::vector<dataTypes::RecordPair> &pairs,
                                const barcodes::Layout &layout, size_t threadCount)
        -> std::vector<double>;

   private:
    struct SampleSummary {
        std::string sampleName;
        double threshold{0.0};
        size_t skippedBarcodeReads{0};
        TagStatistics statistics;
    };

    CountParameters parameters;

    auto tagSample(const CountSample &sample, const barcodes::BarcodeConfig &config,
                   auto &alignmentsOut) const -> SampleSummary;

    static auto readReferences(const std::vector<CountSample> &samples)
        -> std::pair<std::deque<std::string>, std::vector<size_t>>;

    static void writeTagSummary(const fs::path &summaryPath,
                                const std::vector<SampleSummary> &summaries);
};

}  // namespace pipelines::tag
