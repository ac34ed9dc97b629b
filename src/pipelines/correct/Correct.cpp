#include "Correct.hpp"

// Standard
#include <algorithm>
#include <deque>
#include <functional>
#include <future>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

// seqan3
#include <seqan3/io/sam_file/input.hpp>
#include <seqan3/io/sam_file/output.hpp>

// Internal
#include "AlignmentSorter.hpp"
#include "Logger.hpp"
#include "SamRecord.hpp"

using namespace dataTypes;

namespace pipelines::correct {

namespace {
auto referenceName(const std::optional<int32_t> &referenceID) -> std::string {
    return referenceID.has_value() ? std::to_string(referenceID.value()) : "*";
}
}  // namespace

void Correct::Result::operator+=(Result &&other) {
    processedReferences += other.processedReferences;
    processedRecords += other.processedRecords;

    for (auto &[referenceID, corrector] : other.corrections) {
        if (!corrections.emplace(referenceID, std::move(corrector)).second) {
            throw std::runtime_error("Records of reference " + referenceName(referenceID) +
                                     " are not consecutive, the alignments must be sorted");
        }
    }
}

void Correct::process(const fs::path &sortedAlignmentsPath,
                      const fs::path &correctedAlignmentsPath) const {
    Logger::log(LogLevel::INFO, "Correcting UMIs of ", sortedAlignmentsPath);

    const ReferenceCorrections corrections =
        collectCorrections(sortedAlignmentsPath, parameters.threadCount);

    const fs::path partialPath = correctedAlignmentsPath.parent_path() /
                                 (correctedAlignmentsPath.stem().string() + ".partial.bam");
    const size_t correctedRecords =
        writeCorrected(sortedAlignmentsPath, partialPath, corrections);
    fs::rename(partialPath, correctedAlignmentsPath);

    Logger::log(LogLevel::INFO, "Corrected UMIs of ", correctedRecords, " records");

    sort::AlignmentSorter::buildIndex(correctedAlignmentsPath);
}

auto Correct::collectCorrections(const fs::path &sortedAlignmentsPath, size_t threadCount)
    -> ReferenceCorrections {
    SamInput alignmentsIn{sortedAlignmentsPath};

    const size_t workerCount = std::max<size_t>(1, threadCount);

    Result mergedResults;
    {
        AsyncReferenceUmiCountBufferType umiCountBuffer =
            alignmentsIn | AsyncReferenceUmiCountBuffer(workerCount + 1);

        std::vector<std::future<Result>> processResults;
        for (size_t i = 0; i < workerCount; ++i) {
            processResults.emplace_back(std::async(
                std::launch::async, &Correct::clusterReferences, std::ref(umiCountBuffer)));
        }

        std::vector<Result> workerResults;
        for (auto &resultFuture : processResults) {
            workerResults.push_back(resultFuture.get());
        }

        umiCountBuffer.rethrowProducerError();

        for (auto &workerResult : workerResults) {
            mergedResults += std::move(workerResult);
        }
    }

    Logger::log(LogLevel::INFO, "Clustered UMIs of ", mergedResults.processedRecords,
                " records on ", mergedResults.processedReferences, " references");

    return std::move(mergedResults.corrections);
}

auto Correct::clusterReferences(AsyncReferenceUmiCountBufferType &umiCountBuffer) -> Result {
    const DirectionalUmiClusterer clusterer;

    Result result;
    for (ReferenceUmiCounts &umiCounts : umiCountBuffer) {
        result.processedRecords += umiCounts.recordCount;
        ++result.processedReferences;

        Result referenceResult;
        referenceResult.corrections.emplace(
            umiCounts.referenceID,
            UmiCorrector(UmiCorrector::buildCorrections(umiCounts.counts, clusterer)));
        result += std::move(referenceResult);
    }

    return result;
}

auto Correct::writeCorrected(const fs::path &sortedAlignmentsPath, const fs::path &outputPath,
                             const ReferenceCorrections &corrections) -> size_t {
    SamInput alignmentsIn{sortedAlignmentsPath};

    std::vector<size_t> referenceLengths;
    std::ranges::transform(alignmentsIn.header().ref_id_info, std::back_inserter(referenceLengths),
                           [](const auto &info) { return std::get<0>(info); });
    const std::deque<std::string> &referenceIDs = alignmentsIn.header().ref_ids();

    seqan3::sam_file_output alignmentsOut{outputPath, referenceIDs, referenceLengths,
                                          sam_field_ids{}};
    alignmentsOut.header().sorting = "coordinate";

    bool firstRecord = true;
    std::optional<int32_t> currentReference;
    const UmiCorrector *corrector = nullptr;

    size_t correctedRecords = 0;
    for (auto &record : alignmentsIn) {
        if (firstRecord || currentReference != record.reference_id()) {
            firstRecord = false;
            currentReference = record.reference_id();

            const auto correctionIter = corrections.find(currentReference);
            corrector = correctionIter == corrections.end() ? nullptr : &correctionIter->second;
        }

        if (corrector != nullptr && corrector->correct(record)) {
            ++correctedRecords;
        }
        alignmentsOut.push_back(record);
    }

    return correctedRecords;
}

}  // namespace pipelines::correct
