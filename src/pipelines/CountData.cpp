#include "CountData.hpp"

// Standard
#include <map>
#include <numeric>
#include <optional>
#include <ranges>
#include <regex>
#include <stdexcept>
#include <utility>

// seqan3
#include <seqan3/io/sequence_file/input.hpp>

// Internal
#include "Logger.hpp"
#include "Utility.hpp"

namespace pipelines {

CountData::CountData(const fs::path &outputDir, const fs::path &fastqDir,
                     const barcodes::Layout &layout)
    : output(outputDir) {
    samples = retrieveSamples(fastqDir, output.starDir, layout);
}

auto CountData::retrieveSamples(const fs::path &fastqDir, const fs::path &starDir,
                                const barcodes::Layout &layout) -> std::vector<CountSample> {
    const std::vector<ReadPairFiles> readPairs = retrieveReadPairs(fastqDir);

    const bool barcodesInFirstRead = firstReadCarriesBarcodes(readPairs.front(), layout);
    Logger::log(LogLevel::INFO, "Barcodes are read from ", barcodesInFirstRead ? "R1" : "R2",
                " of each read pair");

    std::vector<CountSample> samples;
    samples.reserve(readPairs.size());

    for (const auto &readPair : readPairs) {
        const fs::path starPrefix = starDir / (readPair.sampleName + "_");

        samples.push_back(CountSample{
            .sampleName = readPair.sampleName,
            .barcodeFastqPath =
                barcodesInFirstRead ? readPair.firstFastqPath : readPair.secondFastqPath,
            .genomicFastqPath =
                barcodesInFirstRead ? readPair.secondFastqPath : readPair.firstFastqPath,
            .starPrefix = starPrefix,
            .starAlignmentsPath =
                fs::path(starPrefix.string() + constants::files::starAlignedSuffix)});

        Logger::log(LogLevel::INFO, "Read pair ", readPair.sampleName, " found");
    }

    return samples;
}

auto CountData::retrieveReadPairs(const fs::path &fastqDir) -> std::vector<ReadPairFiles> {
    static const std::regex readNumberPattern{R"(^(.+)_(R?)([12])(_\d+)?$)"};

    struct PairedPaths {
        std::string sampleName;
        std::optional<fs::path> first;
        std::optional<fs::path> second;
    };

    std::map<std::string, PairedPaths> pairedPaths;

    for (const auto &filePath : helper::getValidFilePaths(fastqDir, validInputSuffixes)) {
        if (isHidden(filePath)) {
            continue;
        }

        const std::string stem = getFastqStem(filePath);

        std::smatch match;
        if (!std::regex_match(stem, match, readNumberPattern)) {
            throw std::runtime_error("Could not determine the read number of " +
                                     filePath.string() + " (expected _R1/_R2 or _1/_2)");
        }

        const std::string sampleName = match[1].str() + match[4].str();
        auto &paths = pairedPaths[match[1].str() + "_" + match[2].str() + match[4].str()];
        paths.sampleName = sampleName;

        auto &slot = match[3].str() == "1" ? paths.first : paths.second;
        if (slot.has_value()) {
            throw std::runtime_error("Found more than one file for read " + match[3].str() +
                                     " of " + sampleName + " in " + fastqDir.string());
        }
        slot = filePath;
    }

    std::vector<ReadPairFiles> readPairs;
    for (const auto &[key, paths] : pairedPaths) {
        if (!paths.first.has_value() || !paths.second.has_value()) {
            throw std::runtime_error("Missing mate file for " + paths.sampleName + " in " +
                                     fastqDir.string());
        }
        readPairs.push_back(ReadPairFiles{.sampleName = paths.sampleName,
                                          .firstFastqPath = paths.first.value(),
                                          .secondFastqPath = paths.second.value()});
    }

    if (readPairs.empty()) {
        throw std::runtime_error("No paired FASTQ files found in " + fastqDir.string());
    }

    return readPairs;
}

auto CountData::meanLayoutScore(const fs::path &fastqPath, const barcodes::LayoutAligner &aligner,
                                size_t sampleSize) -> double {
    seqan3::sequence_file_input fastqIn{fastqPath};

    double scoreSum = 0.0;
    size_t scoredRecords = 0;
    for (auto &record : fastqIn | std::views::take(sampleSize)) {
        scoreSum += aligner.align(record.sequence()).normalizedScore;
        ++scoredRecords;
    }

    return scoredRecords == 0 ? 0.0 : scoreSum / static_cast<double>(scoredRecords);
}

auto CountData::firstReadCarriesBarcodes(const ReadPairFiles &readPair,
                                         const barcodes::Layout &layout) -> bool {
    const barcodes::LayoutAligner aligner(layout);
    const size_t sampleSize = constants::pipelines::barcodeReadDetectionSampleSize;

    const double firstScore = meanLayoutScore(readPair.firstFastqPath, aligner, sampleSize);
    const double secondScore = meanLayoutScore(readPair.secondFastqPath, aligner, sampleSize);

    Logger::log(LogLevel::DEBUG, "Mean layout score of ", readPair.firstFastqPath, ": ",
                firstScore, ", of ", readPair.secondFastqPath, ": ", secondScore);

    return firstScore >= secondScore;
}

}  // namespace pipelines
