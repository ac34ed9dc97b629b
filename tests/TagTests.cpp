#include <gtest/gtest.h>

// Standard
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// seqan3
#include <seqan3/alphabet/quality/phred42.hpp>

// Classes
#include "CountData.hpp"
#include "CountParametersFixture.hpp"
#include "CustomSamTags.hpp"
#include "FastqRecord.hpp"
#include "Layout.hpp"
#include "ParseSamRecords.hpp"
#include "Tag.hpp"
#include "Utility.hpp"

using namespace pipelines;

namespace fs = std::filesystem;

namespace {
const std::string perfectRead = "ACACGTCAGTGTGGTTAGTCGAACGT";
const std::string shiftedRead = "CAACTCAGTGTGGTTTCAGGGACGT";
const std::string mismatchRead = "ACACGTCAGTGTGGTAAGTCGAACGT";
const std::string polyTRead = "TTTTTTTTTTTTTTTTTTTTTTTTTT";

auto fastqEntry(const std::string &name, const std::string &sequence) -> std::string {
    return "@" + name + "\n" + sequence + "\n+\n" + std::string(sequence.size(), 'I') + "\n";
}

auto samEntry(const std::string &name, size_t position) -> std::string {
    return name + "\t0\tchromosome1\t" + std::to_string(position) +
           "\t60\t4M\t*\t0\t0\tACGT\tIIII\n";
}

// Barcode reads of read1 to read10, the aligner dropped the poly-T reads read3 and read6
void writeSampleFiles(const fs::path &testDir, const fs::path &starAlignmentsPath) {
    std::string barcodeReads;
    std::string genomicReads;
    std::string alignments = "@HD\tVN:1.6\tSO:unsorted\n@SQ\tSN:chromosome1\tLN:1000\n";
    for (size_t i = 1; i <= 10; ++i) {
        const std::string name = "read" + std::to_string(i);
        std::string sequence = perfectRead;
        if (i == 2) {
            sequence = shiftedRead;
        } else if (i == 3 || i == 6) {
            sequence = polyTRead;
        } else if (i == 10) {
            sequence = mismatchRead;
        }

        barcodeReads += fastqEntry(name, sequence);
        genomicReads += fastqEntry(name, polyTRead);
        if (i != 3 && i != 6) {
            alignments += samEntry(name, 100 - i);
        }
    }

    writeTextFile(testDir / "fastq" / "S_R1.fastq", genomicReads);
    writeTextFile(testDir / "fastq" / "S_R2.fastq", barcodeReads);

    fs::create_directories(starAlignmentsPath.parent_path());
    writeAlignmentFile(starAlignmentsPath, alignments);
}

auto readSummaryRow(const fs::path &summaryPath) -> std::vector<std::string> {
    std::ifstream summaryIn(summaryPath);
    std::string header;
    std::string row;
    std::getline(summaryIn, header);
    std::getline(summaryIn, row);

    std::vector<std::string> fields;
    std::istringstream rowStream(row);
    for (std::string field; std::getline(rowStream, field, '\t');) {
        fields.push_back(field);
    }
    return fields;
}

auto recordPairs(const std::vector<std::string> &sequences) -> std::vector<RecordPair> {
    std::string sam = "@HD\tVN:1.6\n@SQ\tSN:chromosome1\tLN:1000\n";
    for (size_t i = 0; i < sequences.size(); ++i) {
        sam += samEntry("read" + std::to_string(i), i + 1);
    }
    const auto alignedRecords = parseSamRecords(sam);

    std::vector<RecordPair> pairs;
    for (size_t i = 0; i < sequences.size(); ++i) {
        const auto sequence = helper::toDna5(sequences[i]);
        FastqRecord barcodeRecord{sequence, "read" + std::to_string(i),
                                  std::vector<seqan3::phred42>(sequence.size())};
        pairs.push_back(RecordPair{.barcodeRecord = std::move(barcodeRecord),
                                   .alignedRecord = alignedRecords[i]});
    }
    return pairs;
}
}  // namespace

TEST(TagTest, EstimatesThresholdFromGivenPairs) {
    const auto layout = barcodes::Layout::parse(testLayout);

    std::vector<std::string> alignedSequences(7, perfectRead);
    alignedSequences.push_back(mismatchRead);
    EXPECT_GT(tag::Tag::estimateThreshold(recordPairs(alignedSequences), layout, 3), 0.875);

    // Dropped poly-T reads pull the estimate below the mismatching read
    std::vector<std::string> allSequences = alignedSequences;
    allSequences.push_back(polyTRead);
    allSequences.push_back(polyTRead);
    EXPECT_LT(tag::Tag::estimateThreshold(recordPairs(allSequences), layout, 3), 0.875);
}

TEST(TagTest, ScoresPairsInInputOrder) {
    const auto layout = barcodes::Layout::parse(testLayout);
    const std::vector<std::string> sequences = {perfectRead, mismatchRead, perfectRead, polyTRead,
                                                mismatchRead};

    const auto scores = tag::Tag::scoreInParallel(recordPairs(sequences), layout, 2);

    ASSERT_EQ(scores.size(), 5ul);
    EXPECT_DOUBLE_EQ(scores[0], 1.0);
    EXPECT_DOUBLE_EQ(scores[1], 0.875);
    EXPECT_DOUBLE_EQ(scores[2], 1.0);
    EXPECT_LT(scores[3], 0.875);
    EXPECT_DOUBLE_EQ(scores[4], 0.875);

    EXPECT_TRUE(tag::Tag::scoreInParallel({}, layout, 4).empty());
}

class TagProcessTest : public ::testing::TestWithParam<std::string> {};

TEST_P(TagProcessTest, TagsSynchronizedPairsWithThresholdFromAlignedReads) {
    const fs::path testDir = makeTestDir("tag_process_" + GetParam());
    const auto parameters = countParameters(
        testDir, {"--thresholdsample", GetParam(), "--chunksize", "3", "--threads", "2"});

    const fs::path starAlignmentsPath =
        parameters.outputDir / "STAR_files" / "S_Aligned.out.bam";
    writeSampleFiles(testDir, starAlignmentsPath);

    const CountData data(parameters.outputDir, parameters.fastqDir, parameters.layout);
    ASSERT_EQ(data.samples.size(), 1ul);
    ASSERT_EQ(data.samples[0].starAlignmentsPath, starAlignmentsPath);

    tag::Tag(parameters).process(data);

    ASSERT_TRUE(fs::exists(data.output.taggedAlignmentsPath));
    EXPECT_FALSE(fs::exists(parameters.outputDir / "gDNA_with_bc.partial.bam"));

    const auto tagged = readAlignmentFile(data.output.taggedAlignmentsPath);
    std::vector<std::string> taggedIDs;
    for (const auto &record : tagged) {
        taggedIDs.push_back(record.id());
    }
    EXPECT_EQ(taggedIDs, (std::vector<std::string>{"read1", "read2", "read4", "read5", "read7",
                                                   "read8", "read9"}));

    ASSERT_EQ(tagged.size(), 7ul);
    EXPECT_EQ(tags::getString(tagged[0].tags(), tags::cellBarcode), "ACAC.GTGT");
    EXPECT_EQ(tags::getString(tagged[0].tags(), tags::sampleBarcode), "AGT");
    EXPECT_EQ(tags::getString(tagged[0].tags(), tags::rawUmi), "CGA");
    EXPECT_EQ(tags::getString(tagged[1].tags(), tags::cellBarcode), "CAAC.GTGT");
    EXPECT_EQ(tags::getString(tagged[1].tags(), tags::sampleBarcode), "TCA");

    const auto summary = readSummaryRow(data.output.tagSummaryPath);
    ASSERT_EQ(summary.size(), 8ul);
    EXPECT_EQ(summary[0], "S");
    EXPECT_GT(std::stod(summary[1]), 0.875);
    EXPECT_EQ(summary[2], "8");
    EXPECT_EQ(summary[3], "7");
    EXPECT_EQ(summary[4], "1");
    EXPECT_EQ(summary[5], "0");
    EXPECT_EQ(summary[6], "0");
    EXPECT_EQ(summary[7], "2");

    fs::remove_all(testDir);
}

// Threshold sample smaller than, equal to and larger than the number of aligned reads
INSTANTIATE_TEST_SUITE_P(TagTests, TagProcessTest, ::testing::Values("4", "8", "10"));
