#include "ParameterOptions.hpp"

#include <boost/program_options/options_description.hpp>
#include <cstddef>
#include <string>

#include "Constants.hpp"

namespace pi = constants::pipelines;

auto ParameterOptions::getSubcallOptions() -> po::options_description {
    po::options_description subcall("Subcall");
    subcall.add_options()("subcall", po::value<std::string>(), pi::SUBCALL_DESCRIPTION.c_str());

    return subcall;
}

auto ParameterOptions::getGeneralOptions() -> po::options_description {
    po::options_description general(pi::GENERAL_DESCRIPTION);
    general.add_options()("outdir,o", po::value<std::string>(),
                          "(output) folder in which the results are stored (required)");
    general.add_options()("loglevel", po::value<std::string>()->default_value("info"),
                          "log level [debug, info, warning, error] (default: info)");
    general.add_options()("threads,p", po::value<size_t>()->default_value(pi::defaultThreadCount),
                          "max number of threads to be used (default: 1)");
    general.add_options()("chunksize", po::value<size_t>()->default_value(pi::defaultChunkSize),
                          "number of reads processed per chunk in parallel (default: 100000)");

    return general;
}

auto ParameterOptions::getBarcodeOptions() -> po::options_description {
    po::options_description barcodes("Barcodes");
    barcodes.add_options()(
        "layout", po::value<std::string>()->default_value(pi::defaultLayout),
        "expected structure of the barcode read as comma separated segments: N<k> is a "
        "wildcard of length k (cell barcode, sample barcode, UMI), other segments are spacer "
        "sequences with alternatives separated by '|'. Segment roles: barcode 1, spacer 1, "
        "barcode 2, spacer 2, sample barcode, UMI");
    barcodes.add_options()("bcwhitelist", po::value<std::string>(),
                           "file with one cell barcode per line (required for count)");
    barcodes.add_options()("sbcwhitelist", po::value<std::string>(),
                           "file with one sample barcode per line (required for count)");
    barcodes.add_options()(
        "maxbcerr", po::value<size_t>()->default_value(pi::defaultMaxBarcodeError),
        "maximum edit distance between a cell barcode and its whitelist entry (default: 2)");
    barcodes.add_options()(
        "maxsbcerr", po::value<size_t>()->default_value(pi::defaultMaxSampleBarcodeError),
        "maximum edit distance between a sample barcode and its whitelist entry (default: 2)");
    barcodes.add_options()(
        "sbcrejectdelta",
        po::value<size_t>()->default_value(pi::defaultSampleBarcodeRejectDelta),
        "a sample barcode is rejected as ambiguous if the second best whitelist entry is at most "
        "this many edits further away than the best one (default: 1)");

    return barcodes;
}

auto ParameterOptions::getCountOptions() -> po::options_description {
    po::options_description count("Count Pipeline");
    count.add_options()("fastqdir,f", po::value<std::string>(),
                        "folder containing the paired raw reads (<prefix>_R1/_R2 or _1/_2, "
                        ".fastq/.fq, optionally gzipped) (required)");
    count.add_options()("starref", po::value<std::string>(),
                        "STAR genome index directory (required)");
    count.add_options()("star", po::value<std::string>()->default_value(pi::defaultStarExecutable),
                        "STAR executable (default: STAR)");
    count.add_options()(
        "thresholdsample", po::value<size_t>()->default_value(pi::defaultThresholdSampleSize),
        "number of leading barcode reads used to estimate the score threshold (default: 10000)");
    count.add_options()(
        "maxscan", po::value<size_t>()->default_value(pi::defaultMaxScanDistance),
        "maximum number of barcode reads skipped while searching the mate of an aligned read, "
        "0 for unbounded (default: 0)");

    return count;
}

auto ParameterOptions::getParseOptions() -> po::options_description {
    po::options_description parse("Parse Pipeline");
    parse.add_options()("fastq", po::value<std::string>(),
                        "barcode read file to segment according to the layout (required)");

    return parse;
}

auto ParameterOptions::getOtherOptions() -> po::options_description {
    po::options_description other("Other");
    other.add_options()("version,v", "display the version number");
    other.add_options()("help,h", "display this help message");
    other.add_options()("config,c", po::value<std::string>(),
                        "configuration file that contains the parameters");

    return other;
}
