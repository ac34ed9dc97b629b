#include <gtest/gtest.h>

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Classes
#include "AlignmentSorter.hpp"
#include "ParseSamRecords.hpp"

using namespace pipelines::sort;

namespace fs = std::filesystem;

const auto unsortedRecords = R"(@HD	VN:1.6
@SQ	SN:chromosome1	LN:100
@SQ	SN:chromosome2	LN:100
read1	0	chromosome2	50	60	4M	*	0	0	ACGT	!!!!
read2	4	*	0	0	*	*	0	0	ACGT	!!!!
read3	0	chromosome1	70	60	4M	*	0	0	ACGT	!!!!
read4	0	chromosome2	10	60	4M	*	0	0	ACGT	!!!!
read5	0	chromosome1	5	60	4M	*	0	0	ACGT	!!!!
read6	0	chromosome1	70	60	4M	*	0	0	ACGT	!!!!
)";

const std::vector<std::string> sortedIDs = {"read5", "read3", "read6", "read4", "read1", "read2"};

namespace {
auto sortedRecordIDs(const fs::path &path) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto &record : readAlignmentFile(path)) {
        ids.push_back(record.id());
    }
    return ids;
}
}  // namespace

TEST(AlignmentSorterTest, SortsAcrossRuns) {
    const fs::path testDir = makeTestDir("sorter");
    writeTextFile(testDir / "unsorted.sam", unsortedRecords);

    const AlignmentSorter sorter(2);
    sorter.sortByCoordinate(testDir / "unsorted.sam", testDir / "sorted.sam", testDir / "runs");

    EXPECT_FALSE(fs::exists(testDir / "runs"));
    EXPECT_EQ(sortedRecordIDs(testDir / "sorted.sam"), sortedIDs);

    fs::remove_all(testDir);
}

TEST(AlignmentSorterTest, MergesMoreRunsThanFanInInPasses) {
    const fs::path testDir = makeTestDir("sorter_fan_in");
    writeTextFile(testDir / "unsorted.sam", unsortedRecords);

    // Six single record runs merged two at a time
    const AlignmentSorter sorter(1, 2);
    sorter.sortByCoordinate(testDir / "unsorted.sam", testDir / "sorted.bam", testDir / "runs");

    EXPECT_FALSE(fs::exists(testDir / "runs"));
    EXPECT_EQ(sortedRecordIDs(testDir / "sorted.bam"), sortedIDs);

    fs::remove_all(testDir);
}

TEST(AlignmentSorterTest, SortsEmptyInput) {
    const fs::path testDir = makeTestDir("sorter_empty");
    writeTextFile(testDir / "unsorted.sam", "@HD\tVN:1.6\n@SQ\tSN:chromosome1\tLN:100\n");

    const AlignmentSorter sorter(1, 2);
    sorter.sortByCoordinate(testDir / "unsorted.sam", testDir / "sorted.sam", testDir / "runs");

    EXPECT_TRUE(sortedRecordIDs(testDir / "sorted.sam").empty());

    fs::remove_all(testDir);
}
