#include <gtest/gtest.h>

// Standard
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Classes
#include "CustomSamTags.hpp"
#include "ParseSamRecords.hpp"
#include "UmiClusterer.hpp"
#include "UmiCorrector.hpp"

using namespace pipelines::correct;

TEST(DirectionalUmiClustererTest, MergesAbundantNeighbours) {
    const DirectionalUmiClusterer clusterer;

    const UmiMapping mapping =
        clusterer.cluster({{"AAAA", 10}, {"AAAT", 2}, {"AATT", 1}, {"CCCC", 5}});

    EXPECT_EQ(mapping.at("AAAA"), "AAAA");
    EXPECT_EQ(mapping.at("AAAT"), "AAAA");
    EXPECT_EQ(mapping.at("AATT"), "AAAA");
    EXPECT_EQ(mapping.at("CCCC"), "CCCC");
}

TEST(DirectionalUmiClustererTest, RequiresCountRatio) {
    const DirectionalUmiClusterer clusterer;

    // 5 >= 2 * 3 - 1
    const UmiMapping merged = clusterer.cluster({{"AAAA", 5}, {"AAAT", 3}});
    EXPECT_EQ(merged.at("AAAT"), "AAAA");

    // 3 < 2 * 3 - 1, equal counts visit the lexicographically smaller UMI first
    const UmiMapping separate = clusterer.cluster({{"AAAT", 3}, {"AAAA", 3}});
    EXPECT_EQ(separate.at("AAAA"), "AAAA");
    EXPECT_EQ(separate.at("AAAT"), "AAAT");
}

TEST(DirectionalUmiClustererTest, ComparesUmisOfEqualLengthOnly) {
    EXPECT_EQ(DirectionalUmiClusterer::hammingDistance("ACGT", "ACGA"), 1ul);
    EXPECT_EQ(DirectionalUmiClusterer::hammingDistance("ACGT", "ACGT"), 0ul);
    EXPECT_GT(DirectionalUmiClusterer::hammingDistance("ACGT", "ACG"), 1ul);
}

const auto umiRecords = R"(@HD	VN:1.6	SO:coordinate
@SQ	SN:chromosome1	LN:100
read1	0	chromosome1	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read2	0	chromosome1	2	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read3	0	chromosome1	3	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read4	0	chromosome1	4	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAT
read5	0	chromosome1	5	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:TCA.GGTT	SB:Z:AGT	UR:Z:AAAT
read6	0	chromosome1	6	60	4M	*	0	0	ACGT	!!!!	CB:Z:CAAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT
)";

TEST(UmiCorrectorTest, CountsUmisPerCompleteBarcode) {
    const auto records = parseSamRecords(umiRecords);

    BarcodeUmiCounts counts;
    size_t countedRecords = 0;
    for (const auto &record : records) {
        if (UmiCorrector::countUmi(counts, record)) {
            ++countedRecords;
        }
    }

    EXPECT_EQ(countedRecords, 5ul);
    ASSERT_EQ(counts.size(), 2ul);
    EXPECT_EQ(counts.at("ACAC.GTGT:4:AGT").at("AAAA"), 3ul);
    EXPECT_EQ(counts.at("ACAC.GTGT:4:AGT").at("AAAT"), 1ul);
    EXPECT_EQ(counts.at("ACAC.GTGT:3:AGT").at("AAAT"), 1ul);
}

TEST(UmiCorrectorTest, SetsCorrectedUmiPerCompleteBarcode) {
    auto records = parseSamRecords(umiRecords);

    BarcodeUmiCounts counts;
    for (const auto &record : records) {
        UmiCorrector::countUmi(counts, record);
    }
    const UmiCorrector corrector(
        UmiCorrector::buildCorrections(counts, DirectionalUmiClusterer{}));

    size_t correctedRecords = 0;
    for (auto &record : records) {
        if (corrector.correct(record)) {
            ++correctedRecords;
        }
    }

    EXPECT_EQ(correctedRecords, 5ul);
    EXPECT_EQ(tags::getString(records[0].tags(), tags::correctedUmi), "AAAA");
    EXPECT_EQ(tags::getString(records[3].tags(), tags::correctedUmi), "AAAA");
    // Same UMI under the shifted spacer is a different barcode
    EXPECT_EQ(tags::getString(records[4].tags(), tags::correctedUmi), "AAAT");
    EXPECT_EQ(tags::getString(records[5].tags(), tags::correctedUmi), std::nullopt);
    EXPECT_EQ(tags::getString(records[4].tags(), tags::rawUmi), "AAAT");
}

TEST(UmiCorrectorTest, LeavesUnknownUmisUncorrected) {
    auto records = parseSamRecords(umiRecords);

    const UmiCorrector corrector(CorrectionMap{});
    EXPECT_FALSE(corrector.correct(records[0]));
    EXPECT_EQ(tags::getString(records[0].tags(), tags::correctedUmi), std::nullopt);
}
