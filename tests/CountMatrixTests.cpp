#include <gtest/gtest.h>

// Standard
#include <deque>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Boost
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

// Classes
#include "Count.hpp"
#include "CountMatrix.hpp"
#include "CountMatrixAssembler.hpp"
#include "ParseSamRecords.hpp"

using namespace pipelines::count;

namespace {
auto readGzipFile(const std::filesystem::path &path) -> std::string {
    namespace io = boost::iostreams;

    io::filtering_istream in;
    in.push(io::gzip_decompressor());
    in.push(io::file_source(path.string(), std::ios_base::in | std::ios_base::binary));

    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}
}  // namespace

TEST(CountMatrixTest, AccumulatesSparseEntries) {
    CountMatrix matrix(2, 3);
    matrix.add(0, 1, 5);
    matrix.add(1, 0, 2);
    matrix.add(0, 1, 1);
    matrix.add(1, 2, 0);

    EXPECT_EQ(matrix.at(0, 1), 6ul);
    EXPECT_EQ(matrix.at(1, 0), 2ul);
    EXPECT_EQ(matrix.at(1, 2), 0ul);
    EXPECT_EQ(matrix.nonZeroCount(), 2ul);
    EXPECT_THROW(matrix.add(2, 0, 1), std::out_of_range);
    EXPECT_THROW(matrix.add(0, 3, 1), std::out_of_range);

    const CountMatrix transposed = matrix.transposed();
    EXPECT_EQ(transposed.rows(), 3ul);
    EXPECT_EQ(transposed.cols(), 2ul);
    EXPECT_EQ(transposed.at(1, 0), 6ul);
    EXPECT_EQ(transposed.at(0, 1), 2ul);
}

TEST(CountMatrixTest, WritesMatrixMarketCoordinates) {
    CountMatrix matrix(2, 3);
    matrix.add(0, 1, 6);
    matrix.add(1, 0, 2);

    std::ostringstream out;
    matrix.writeMatrixMarket(out);

    EXPECT_EQ(out.str(),
              "%%MatrixMarket matrix coordinate integer general\n"
              "%\n"
              "2 3 2\n"
              "2 1 2\n"
              "1 2 6\n");
}

TEST(CountMatrixAssemblerTest, CountsReadsAndDistinctUmis) {
    CountMatrixAssembler assembler;
    assembler.add(0, "bcA", "u1");
    assembler.add(0, "bcA", "u1");
    assembler.add(0, "bcA", "u2");
    assembler.add(1, "bcC", "u1");
    assembler.add(2, "bcA", "u3");

    const CountMatrices matrices = assembler.assemble({"gene1", "gene2", "gene3"});

    EXPECT_EQ(matrices.barcodeLabels, (std::vector<std::string>{"bcA", "bcC"}));
    EXPECT_EQ(matrices.referenceLabels, (std::vector<std::string>{"gene1", "gene2", "gene3"}));

    EXPECT_EQ(matrices.readCounts.at(0, 0), 3ul);
    EXPECT_EQ(matrices.umiCounts.at(0, 0), 2ul);
    EXPECT_EQ(matrices.readCounts.at(1, 1), 1ul);
    EXPECT_EQ(matrices.umiCounts.at(1, 1), 1ul);
    EXPECT_EQ(matrices.readCounts.at(2, 0), 1ul);
    EXPECT_EQ(matrices.umiCounts.at(2, 0), 1ul);
    EXPECT_EQ(matrices.readCounts.at(1, 0), 0ul);
    EXPECT_EQ(matrices.readCounts.nonZeroCount(), 3ul);
}

TEST(CountMatrixAssemblerTest, MergesPartialAggregates) {
    CountMatrixAssembler first;
    first.add(0, "bcB", "u1");
    CountMatrixAssembler second;
    second.add(0, "bcB", "u1");
    second.add(0, "bcA", "u2");

    first += second;
    const CountMatrices matrices = first.assemble({"gene1"});

    EXPECT_EQ(matrices.barcodeLabels, (std::vector<std::string>{"bcA", "bcB"}));
    EXPECT_EQ(matrices.readCounts.at(0, 1), 2ul);
    EXPECT_EQ(matrices.umiCounts.at(0, 1), 1ul);
    EXPECT_EQ(matrices.readCounts.at(0, 0), 1ul);
}

TEST(CountMatrixAssemblerTest, RequiresReferenceLabels) {
    CountMatrixAssembler assembler;
    assembler.add(3, "bcA", "u1");

    EXPECT_THROW(assembler.assemble({"gene1"}), std::out_of_range);
}

TEST(CountMatrixAssemblerTest, CountsTaggedRecords) {
    const auto records = parseSamRecords(R"(@HD	VN:1.6	SO:coordinate
@SQ	SN:chromosome1	LN:100
@SQ	SN:chromosome2	LN:100
read1	0	chromosome1	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UB:Z:AAAA
read2	0	chromosome2	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:TCA.GGTT	SB:Z:AGT	UB:Z:AAAA
read3	0	chromosome2	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:TCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read4	4	*	0	0	*	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:TCA.GGTT	SB:Z:AGT	UB:Z:AAAA
)");

    CountMatrixAssembler assembler;
    EXPECT_TRUE(assembler.add(records[0]));
    EXPECT_TRUE(assembler.add(records[1]));
    EXPECT_FALSE(assembler.add(records[2]));
    EXPECT_FALSE(assembler.add(records[3]));

    const CountMatrices matrices = assembler.assemble({"chromosome1", "chromosome2"});
    EXPECT_EQ(matrices.barcodeLabels,
              (std::vector<std::string>{"ACAC.GTGT:3:AGT", "ACAC.GTGT:4:AGT"}));
    EXPECT_EQ(matrices.readCounts.at(0, 1), 1ul);
    EXPECT_EQ(matrices.readCounts.at(1, 0), 1ul);
}

TEST(CountMatrixDirectoryTest, WritesBarcodeByReferenceMatrix) {
    CountMatrixAssembler assembler;
    assembler.add(0, "bcA", "u1");
    assembler.add(0, "bcA", "u2");
    assembler.add(1, "bcB", "u1");
    const CountMatrices matrices = assembler.assemble({"gene1", "gene2", "gene3"});

    const std::filesystem::path testDir = makeTestDir("matrix_directory");
    const std::filesystem::path matrixDir = testDir / "raw_reads_bc_matrix";

    Count::writeMatrixDirectory(matrixDir, matrices.readCounts, matrices);

    EXPECT_FALSE(std::filesystem::exists(testDir / "raw_reads_bc_matrix.partial"));
    EXPECT_EQ(readGzipFile(matrixDir / "matrix.mtx.gz"),
              "%%MatrixMarket matrix coordinate integer general\n"
              "%\n"
              "2 3 2\n"
              "1 1 2\n"
              "2 2 1\n");
    EXPECT_EQ(readGzipFile(matrixDir / "barcodes.tsv.gz"), "bcA\nbcB\n");
    EXPECT_EQ(readGzipFile(matrixDir / "features.tsv.gz"), "gene1\ngene2\ngene3\n");

    std::filesystem::remove_all(testDir);
}
