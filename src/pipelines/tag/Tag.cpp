#include "Tag.hpp"

// Standard
#include <algorithm>
#include <deque>
#include <fstream>
#include <iterator>
#include <future>
#include <optional>
#include <stdexcept>

// seqan3
#include <seqan3/io/sam_file/input.hpp>
#include <seqan3/io/sam_file/output.hpp>
#include <seqan3/io/sequence_file/input.hpp>

// Internal
#include "FastqRecord.hpp"
#include "LayoutAligner.hpp"
#include "Logger.hpp"
#include "OrderedChunkProcessor.hpp"
#include "PairedRecordSynchronizer.hpp"
#include "SamRecord.hpp"
#include "ScoreThreshold.hpp"

using namespace dataTypes;

namespace pipelines::tag {

void Tag::process(const CountData &data) const {
    Logger::log(LogLevel::INFO, "Tagging alignments with barcodes");

    const barcodes::BarcodeConfig config = parameters.barcodeConfig();
    Logger::log(LogLevel::INFO, "Loaded ", config.barcodeWhitelist.size(), " cell barcodes and ",
                config.sampleBarcodeWhitelist.size(), " sample barcodes");

    const auto [referenceIDs, referenceLengths] = readReferences(data.samples);

    const fs::path &outputPath = data.output.taggedAlignmentsPath;
    const fs::path partialPath =
        outputPath.parent_path() / (outputPath.stem().string() + ".partial.bam");

    std::vector<SampleSummary> summaries;
    {
        seqan3::sam_file_output alignmentsOut{partialPath, referenceIDs, referenceLengths,
                                              sam_field_ids{}};

        for (const auto &sample : data.samples) {
            summaries.push_back(tagSample(sample, config, alignmentsOut));
        }
    }

    fs::rename(partialPath, outputPath);

    writeTagSummary(data.output.tagSummaryPath, summaries);

    TagStatistics totalStatistics;
    for (const auto &summary : summaries) {
        totalStatistics += summary.statistics;
    }
    Logger::log(LogLevel::INFO, "Tagging done (", totalStatistics, ")");
}

auto Tag::tagSample(const CountSample &sample, const barcodes::BarcodeConfig &config,
                    auto &alignmentsOut) const -> SampleSummary {
    Logger::log(LogLevel::INFO, "Processing read pair: ", sample.sampleName);

    SampleSummary summary{.sampleName = sample.sampleName};

    FastqInput barcodeRecordsIn{sample.barcodeFastqPath};
    SamInput alignmentsIn{sample.starAlignmentsPath};

    PairedRecordSynchronizer<FastqInput, SamInput> synchronizer(barcodeRecordsIn, alignmentsIn,
                                                                parameters.maxScanDistance);

    std::deque<RecordPair> sampledPairs;
    {
        std::vector<RecordPair> thresholdPairs;
        while (thresholdPairs.size() < parameters.thresholdSampleSize) {
            auto pair = synchronizer.next();
            if (!pair.has_value()) {
                break;
            }
            thresholdPairs.push_back(std::move(pair.value()));
        }

        summary.threshold =
            estimateThreshold(thresholdPairs, config.layout, parameters.threadCount);
        std::ranges::move(thresholdPairs, std::back_inserter(sampledPairs));
    }
    Logger::log(LogLevel::INFO, "Layout score threshold: ", summary.threshold);

    const size_t chunkSize = parameters.chunkSize;
    auto nextChunk = [&synchronizer, &sampledPairs,
                      chunkSize]() -> std::optional<std::vector<RecordPair>> {
        std::vector<RecordPair> chunk;
        chunk.reserve(chunkSize);
        while (chunk.size() < chunkSize && !sampledPairs.empty()) {
            chunk.push_back(std::move(sampledPairs.front()));
            sampledPairs.pop_front();
        }
        while (chunk.size() < chunkSize) {
            auto pair = synchronizer.next();
            if (!pair.has_value()) {
                break;
            }
            chunk.push_back(std::move(pair.value()));
        }

        if (chunk.empty()) {
            return std::nullopt;
        }
        return chunk;
    };

    const double threshold = summary.threshold;
    auto tagChunk = [&config, threshold](std::vector<RecordPair> chunk) -> TaggedChunk {
        return tagRecordPairs(std::move(chunk), config, threshold);
    };

    auto writeChunk = [&alignmentsOut, &summary](TaggedChunk taggedChunk) {
        for (auto &record : taggedChunk.records) {
            alignmentsOut.push_back(record);
        }
        summary.statistics += taggedChunk.statistics;
    };

    const OrderedChunkProcessor processor(parameters.threadCount);
    const size_t chunkCount = processor.run(nextChunk, tagChunk, writeChunk);

    summary.skippedBarcodeReads = synchronizer.getSkippedCount();

    Logger::log(LogLevel::INFO, "Finished read pair ", sample.sampleName, " in ", chunkCount,
                " chunks (", summary.statistics, ", ", summary.skippedBarcodeReads,
                " barcode reads skipped)");

    return summary;
}

auto Tag::estimateThreshold(const std::vector<RecordPair> &sampledPairs,
                            const barcodes::Layout &layout, size_t threadCount) -> double {
    Logger::log(LogLevel::DEBUG, "Estimating threshold from ", sampledPairs.size(),
                " synchronized barcode reads");

    return barcodes::ScoreThreshold::estimate(scoreInParallel(sampledPairs, layout, threadCount));
}

auto Tag::scoreInParallel(const std::vector<RecordPair> &pairs, const barcodes::Layout &layout,
                          size_t threadCount) -> std::vector<double> {
    const size_t workerCount = std::max<size_t>(1, std::min(threadCount, pairs.size()));
    const size_t sliceSize = (pairs.size() + workerCount - 1) / workerCount;

    auto scoreSlice = [&pairs, &layout](size_t begin, size_t end) -> std::vector<double> {
        const barcodes::LayoutAligner aligner(layout);
        std::vector<double> scores;
        scores.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            scores.push_back(aligner.align(pairs[i].barcodeRecord.sequence()).normalizedScore);
        }
        return scores;
    };

    std::vector<std::future<std::vector<double>>> sliceScores;
    for (size_t begin = 0; begin < pairs.size(); begin += sliceSize) {
        const size_t end = std::min(begin + sliceSize, pairs.size());
        sliceScores.emplace_back(std::async(std::launch::async, scoreSlice, begin, end));
    }

    std::vector<double> scores;
    scores.reserve(pairs.size());
    for (auto &slice : sliceScores) {
        const auto sliceResult = slice.get();
        scores.insert(scores.end(), sliceResult.begin(), sliceResult.end());
    }

    return scores;
}

auto Tag::readReferences(const std::vector<CountSample> &samples)
    -> std::pair<std::deque<std::string>, std::vector<size_t>> {
    std::optional<std::deque<std::string>> referenceIDs;
    std::vector<size_t> referenceLengths;

    for (const auto &sample : samples) {
        SamInput alignmentsIn{sample.starAlignmentsPath};
        const std::deque<std::string> &sampleReferenceIDs = alignmentsIn.header().ref_ids();

        if (!referenceIDs.has_value()) {
            referenceIDs = sampleReferenceIDs;
            std::ranges::transform(alignmentsIn.header().ref_id_info,
                                   std::back_inserter(referenceLengths),
                                   [](const auto &info) { return std::get<0>(info); });
            continue;
        }

        if (referenceIDs.value() != sampleReferenceIDs) {
            throw std::runtime_error("Reference sequences of " +
                                     sample.starAlignmentsPath.string() +
                                     " differ from those of the other read pairs");
        }
    }

    if (!referenceIDs.has_value()) {
        throw std::runtime_error("No alignments to tag");
    }

    return {referenceIDs.value(), referenceLengths};
}

void Tag::writeTagSummary(const fs::path &summaryPath,
                          const std::vector<SampleSummary> &summaries) {
    std::ofstream summaryOut(summaryPath);
    if (!summaryOut.is_open()) {
        throw std::runtime_error("Could not open tag summary: " + summaryPath.string());
    }

    summaryOut << "sample\tthreshold\tprocessed\taccepted\tlow_score\tundecodable_barcode\t"
                  "undecodable_sample_barcode\tskipped_barcode_reads\n";

    for (const auto &summary : summaries) {
        const auto &statistics = summary.statistics;
        summaryOut << summary.sampleName << '\t' << summary.threshold << '\t'
                   << statistics.processedRecords << '\t' << statistics.acceptedRecords << '\t'
                   << statistics.lowScoreRecords << '\t' << statistics.undecodableBarcodeRecords
                   << '\t' << statistics.undecodableSampleBarcodeRecords << '\t'
                   << summary.skippedBarcodeReads << '\n';
    }

    Logger::log(LogLevel::INFO, "Tag summary written to ", summaryPath);
}

}  // namespace pipelines::tag
