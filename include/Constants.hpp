#pragma once
// Standard
#include <cstddef>
#include <string>

namespace constants::pipelines {
const std::string COUNT = "count";
const std::string PARSE = "parse";

const std::string GENERAL_DESCRIPTION =
    "SDRcount extracts cell barcodes, sample barcodes and UMIs from barcode reads, tags the "
    "aligned mate reads and builds sparse read and UMI count matrices.\nRun SDRcount with the "
    "subcall \"count\" to execute all pipeline steps.\n\nMinimum call: SDRcount count -f "
    "<fastq-dir> -o <output-dir> --starref <star-genome-dir> --bcwhitelist <file> "
    "--sbcwhitelist <file>\nOr run SDRcount with a config file: SDRcount count -c "
    "<config-file>\n\nGeneral Options";
const std::string SUBCALL_DESCRIPTION =
    "The subcall to execute. The following subcalls are available: count, parse.";

// General defaults
constexpr size_t defaultChunkSize = 100000;
constexpr size_t defaultThreadCount = 1;

// Barcode defaults
const std::string defaultLayout =
    "N9,GTCAGTACGTACGAGTC|TCAGTACGTACGAGTC|CAGTACGTACGAGTC|AGTACGTACGAGTC,N9,GTACTCGCAGTAGTC,N8,"
    "N8";
constexpr size_t defaultMaxBarcodeError = 2;
constexpr size_t defaultMaxSampleBarcodeError = 2;
constexpr size_t defaultSampleBarcodeRejectDelta = 1;

// Count defaults
constexpr size_t defaultThresholdSampleSize = 10000;
constexpr size_t defaultMaxScanDistance = 0;
const std::string defaultStarExecutable = "STAR";
constexpr size_t barcodeReadDetectionSampleSize = 1000;

// Sorted runs opened at once while merging
constexpr size_t defaultMergeFanIn = 64;
}  // namespace constants::pipelines

namespace constants::layout {
// Positions of the barcode roles within the expected read layout
constexpr size_t firstCellBarcodeSegment = 0;
constexpr size_t firstFillerSegment = 1;
constexpr size_t secondCellBarcodeSegment = 2;
constexpr size_t secondFillerSegment = 3;
constexpr size_t sampleBarcodeSegment = 4;
constexpr size_t umiSegment = 5;
constexpr size_t segmentCount = 6;

constexpr char segmentSeparator = ',';
constexpr char variantSeparator = '|';
constexpr char pieceSeparator = '.';
}  // namespace constants::layout

namespace constants::files {
const std::string starDirectory = "STAR_files";
const std::string starAlignedSuffix = "Aligned.out.bam";
const std::string taggedAlignments = "gDNA_with_bc.bam";
const std::string sortedTaggedAlignments = "gDNA_with_bc.sorted.bam";
const std::string correctedAlignments = "gDNA_with_bc_umi.sorted.bam";
const std::string tagSummary = "tag_summary.tsv";
const std::string readMatrixDirectory = "raw_reads_bc_matrix";
const std::string umiMatrixDirectory = "raw_umis_bc_matrix";
const std::string matrixFile = "matrix.mtx.gz";
const std::string barcodesFile = "barcodes.tsv.gz";
const std::string featuresFile = "features.tsv.gz";
const std::string parsedFastqSuffix = "_parsed.fastq";
}  // namespace constants::files
