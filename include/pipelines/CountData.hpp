#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Internal
#include "Constants.hpp"
#include "Layout.hpp"
#include "LayoutAligner.hpp"
#include "PipelineData.hpp"

namespace pipelines {

namespace fs = std::filesystem;

struct ReadPairFiles {
    std::string sampleName;
    fs::path firstFastqPath;
    fs::path secondFastqPath;
};

struct CountSample {
    std::string sampleName;
    fs::path barcodeFastqPath;
    fs::path genomicFastqPath;
    fs::path starPrefix;
    fs::path starAlignmentsPath;
};

struct CountOutput {
    fs::path starDir;
    fs::path taggedAlignmentsPath;
    fs::path sortedAlignmentsPath;
    fs::path correctedAlignmentsPath;
    fs::path tagSummaryPath;
    fs::path readMatrixDir;
    fs::path umiMatrixDir;

    explicit CountOutput(const fs::path &outputDir)
        : starDir(outputDir / constants::files::starDirectory),
          taggedAlignmentsPath(outputDir / constants::files::taggedAlignments),
          sortedAlignmentsPath(outputDir / constants::files::sortedTaggedAlignments),
          correctedAlignmentsPath(outputDir / constants::files::correctedAlignments),
          tagSummaryPath(outputDir / constants::files::tagSummary),
          readMatrixDir(outputDir / constants::files::readMatrixDirectory),
          umiMatrixDir(outputDir / constants::files::umiMatrixDirectory) {}
};

struct CountData : public PipelineData {
    std::vector<CountSample> samples;
    CountOutput output;

    CountData(const fs::path &outputDir, const fs::path &fastqDir,
              const barcodes::Layout &layout);

    /**
     * Pairs the FASTQ files of a directory by the read number token ("_R1"/"_R2" or "_1"/"_2")
     * before the suffix, e.g. "A_S1_L001_R1_001.fastq.gz" and "A_S1_L001_R2_001.fastq.gz".
     *
     * @throws std::runtime_error if a file has no partner or no pair is found.
     */
    static auto retrieveReadPairs(const fs::path &fastqDir) -> std::vector<ReadPairFiles>;

    /**
     * Mean layout score of the first records of a FASTQ file.
     */
    static auto meanLayoutScore(const fs::path &fastqPath, const barcodes::LayoutAligner &aligner,
                                size_t sampleSize) -> double;

    /**
     * Decides which read of a pair carries the barcodes by comparing the mean layout scores of
     * the first records of both files.
     */
    static auto firstReadCarriesBarcodes(const ReadPairFiles &readPair,
                                         const barcodes::Layout &layout) -> bool;

   private:
    static auto retrieveSamples(const fs::path &fastqDir, const fs::path &starDir,
                                const barcodes::Layout &layout) -> std::vector<CountSample>;
};

}  // namespace pipelines
