#include <gtest/gtest.h>

// Standard
#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// seqan3
#include <seqan3/io/sam_file/format_sam.hpp>

// Classes
#include "AsyncReferenceUmiCountBuffer.hpp"
#include "SamRecord.hpp"

using namespace pipelines::correct;

const auto groupedRecords = R"(@HD	VN:1.6	SO:coordinate
@SQ	SN:chromosome1	LN:100
@SQ	SN:chromosome2	LN:100
@SQ	SN:chromosome3	LN:100
read1	0	chromosome1	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read2	0	chromosome1	5	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAA
read3	0	chromosome1	9	60	4M	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:AAAT
read4	0	chromosome3	1	60	4M	*	0	0	ACGT	!!!!	CB:Z:CAAC.GTGT	FB:Z:TCA.GGTT	SB:Z:TCA	UR:Z:CCCC
read5	0	chromosome3	7	60	4M	*	0	0	ACGT	!!!!	CB:Z:CAAC.GTGT	FB:Z:TCA.GGTT	SB:Z:TCA
read6	4	*	0	0	*	*	0	0	ACGT	!!!!	CB:Z:ACAC.GTGT	FB:Z:GTCA.GGTT	SB:Z:AGT	UR:Z:GGGG
)";

TEST(AsyncReferenceUmiCountBufferTest, CountsUmisPerReference) {
    dataTypes::SamInput alignmentsIn{std::istringstream{groupedRecords}, seqan3::format_sam{}};

    AsyncReferenceUmiCountBufferType buffer = alignmentsIn | AsyncReferenceUmiCountBuffer(2);

    std::vector<std::optional<int32_t>> referenceIDs;
    std::vector<size_t> recordCounts;
    std::vector<BarcodeUmiCounts> counts;
    for (auto &umiCounts : buffer) {
        referenceIDs.push_back(umiCounts.referenceID);
        recordCounts.push_back(umiCounts.recordCount);
        counts.push_back(umiCounts.counts);
    }
    buffer.rethrowProducerError();

    EXPECT_EQ(referenceIDs, (std::vector<std::optional<int32_t>>{0, 2, std::nullopt}));
    EXPECT_EQ(recordCounts, (std::vector<size_t>{3, 2, 1}));

    ASSERT_EQ(counts.size(), 3ul);
    EXPECT_EQ(counts[0].at("ACAC.GTGT:4:AGT").at("AAAA"), 2ul);
    EXPECT_EQ(counts[0].at("ACAC.GTGT:4:AGT").at("AAAT"), 1ul);
    // read5 carries no UMI and is not counted
    EXPECT_EQ(counts[1].at("CAAC.GTGT:3:TCA").size(), 1ul);
    EXPECT_EQ(counts[1].at("CAAC.GTGT:3:TCA").at("CCCC"), 1ul);
    EXPECT_EQ(counts[2].at("ACAC.GTGT:4:AGT").at("GGGG"), 1ul);
}

TEST(AsyncReferenceUmiCountBufferTest, SharesReferencesBetweenWorkers) {
    dataTypes::SamInput alignmentsIn{std::istringstream{groupedRecords}, seqan3::format_sam{}};

    AsyncReferenceUmiCountBufferType buffer = alignmentsIn | AsyncReferenceUmiCountBuffer(1);

    auto worker = [&buffer]() -> size_t {
        size_t records = 0;
        for (auto &umiCounts : buffer) {
            records += umiCounts.recordCount;
        }
        return records;
    };

    auto first = std::async(std::launch::async, worker);
    auto second = std::async(std::launch::async, worker);

    EXPECT_EQ(first.get() + second.get(), 6ul);
    buffer.rethrowProducerError();
}

TEST(AsyncReferenceUmiCountBufferTest, HandlesEmptyInput) {
    dataTypes::SamInput alignmentsIn{std::istringstream{"@HD\tVN:1.6\tSO:coordinate\n"},
                                     seqan3::format_sam{}};

    AsyncReferenceUmiCountBufferType buffer = alignmentsIn | AsyncReferenceUmiCountBuffer(1);

    size_t references = 0;
    for ([[maybe_unused]] auto &umiCounts : buffer) {
        ++references;
    }
    buffer.rethrowProducerError();

    EXPECT_EQ(references, 0ul);
}

TEST(AsyncReferenceUmiCountBufferTest, RejectsEmptyBuffer) {
    dataTypes::SamInput alignmentsIn{std::istringstream{groupedRecords}, seqan3::format_sam{}};

    EXPECT_THROW(alignmentsIn | AsyncReferenceUmiCountBuffer(0), std::invalid_argument);
}
