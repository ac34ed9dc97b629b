#include <gtest/gtest.h>

// Standard
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>

// Classes
#include "Layout.hpp"
#include "LayoutAligner.hpp"
#include "Utility.hpp"

using namespace pipelines::barcodes;

TEST(LayoutTest, ParsesWildcardsAndVariants) {
    const Layout layout = Layout::parse("N9,AC|GT,NNNN,GTT,N8,n2");

    ASSERT_EQ(layout.size(), 6ul);
    EXPECT_TRUE(layout.segments[0].isWildcard());
    EXPECT_EQ(layout.segments[0].wildcardLength, 9ul);
    EXPECT_EQ(layout.segments[1].variants.size(), 2ul);
    EXPECT_EQ(layout.segments[1].length(1), 2ul);
    EXPECT_TRUE(layout.segments[2].isWildcard());
    EXPECT_EQ(layout.segments[2].length(0), 4ul);
    EXPECT_FALSE(layout.segments[3].isWildcard());
    EXPECT_EQ(layout.segments[5].wildcardLength, 2ul);

    std::ostringstream description;
    description << layout;
    EXPECT_EQ(description.str(), "N9,AC|GT,N4,GTT,N8,N2");
}

TEST(LayoutTest, RejectsInvalidDescriptions) {
    EXPECT_THROW(Layout::parse(""), std::invalid_argument);
    EXPECT_THROW(Layout::parse("N9,,N3"), std::invalid_argument);
    EXPECT_THROW(Layout::parse("N9,AXC"), std::invalid_argument);
    EXPECT_THROW(Layout::parse("N0,ACGT"), std::invalid_argument);
    EXPECT_THROW(Layout::parse("N3,AC|G1"), std::invalid_argument);
}

TEST(LayoutTest, EnumeratesCombinationsFirstSegmentSlowest) {
    const Layout layout = Layout::parse("A|C,N2,G|T");

    const std::vector<std::vector<size_t>> expected = {
        {0, 0, 0}, {0, 0, 1}, {1, 0, 0}, {1, 0, 1}};
    EXPECT_EQ(layout.variantCombinations(), expected);
}

class LayoutAlignerTest : public ::testing::Test {
   protected:
    const LayoutAligner aligner{Layout::parse("N4,GTCA|TCA,N4,GGTT,N3,N3")};
};

TEST_F(LayoutAlignerTest, AlignsExactRead) {
    const auto alignment = aligner.align(helper::toDna5("ACACGTCAGTGTGGTTAGTCGAACGT"));

    EXPECT_DOUBLE_EQ(alignment.normalizedScore, 1.0);
    const std::vector<std::string> expectedPieces = {"ACAC", "GTCA", "GTGT", "GGTT", "AGT", "CGA"};
    EXPECT_EQ(alignment.pieces, expectedPieces);
    EXPECT_EQ(alignment.endPosition, 22ul);
    EXPECT_EQ(alignment.variantIndices[1], 0ul);
}

TEST_F(LayoutAlignerTest, PicksShiftedSpacerVariant) {
    const auto alignment = aligner.align(helper::toDna5("ACACTCAGTGTGGTTAGTCGAACGT"));

    EXPECT_DOUBLE_EQ(alignment.normalizedScore, 1.0);
    EXPECT_EQ(alignment.variantIndices[1], 1ul);
    EXPECT_EQ(alignment.pieces[1], "TCA");
    EXPECT_EQ(alignment.pieces[2], "GTGT");
    EXPECT_EQ(alignment.endPosition, 21ul);
}

TEST_F(LayoutAlignerTest, ScoresMismatchesInsteadOfRejecting) {
    // One mismatch in each spacer
    const auto alignment = aligner.align(helper::toDna5("ACACGTCTGTGTGGTAAGTCGA"));

    EXPECT_DOUBLE_EQ(alignment.normalizedScore, 6.0 / 8.0);
    EXPECT_EQ(alignment.pieces.size(), 6ul);
}

TEST_F(LayoutAlignerTest, TruncatedReadsNeverScoreHigher) {
    const std::string read = "ACACGTCAGTGTGGTTAGTCGAACGT";
    const double fullScore = aligner.align(helper::toDna5(read)).normalizedScore;

    double previousScore = 0.0;
    for (size_t length = 0; length <= read.size(); ++length) {
        const auto alignment = aligner.align(helper::toDna5(read.substr(0, length)));

        EXPECT_EQ(alignment.pieces.size(), 6ul);
        EXPECT_LE(alignment.endPosition, length);
        EXPECT_LE(alignment.normalizedScore, fullScore);
        EXPECT_GE(alignment.normalizedScore, previousScore);
        previousScore = alignment.normalizedScore;
    }
}

TEST_F(LayoutAlignerTest, HandlesEmptyRead) {
    const auto alignment = aligner.align(seqan3::dna5_vector{});

    EXPECT_DOUBLE_EQ(alignment.normalizedScore, 0.0);
    EXPECT_EQ(alignment.endPosition, 0ul);
    for (const auto &piece : alignment.pieces) {
        EXPECT_TRUE(piece.empty());
    }
}

TEST(LayoutAlignerTieTest, KeepsFirstCombinationOnTie) {
    const LayoutAligner aligner(Layout::parse("N2,ACGT|ACGA,N1"));

    const auto alignment = aligner.align(helper::toDna5("TTACGCG"));

    EXPECT_DOUBLE_EQ(alignment.normalizedScore, 0.75);
    EXPECT_EQ(alignment.variantIndices[1], 0ul);
}

TEST(LayoutAlignerTieTest, UndeterminedBasesNeverMatch) {
    const LayoutAligner aligner(Layout::parse("N1,ACGT,N1"));

    EXPECT_DOUBLE_EQ(aligner.align(helper::toDna5("TNNNNT")).normalizedScore, 0.0);
    EXPECT_DOUBLE_EQ(aligner.align(helper::toDna5("TACNNT")).normalizedScore, 0.5);
}
