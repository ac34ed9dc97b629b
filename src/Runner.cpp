#include "Runner.hpp"

// Standard
#include <exception>
#include <filesystem>
#include <string>
#include <variant>

// Internal
#include "Align.hpp"
#include "AlignmentSorter.hpp"
#include "Correct.hpp"
#include "Count.hpp"
#include "Logger.hpp"
#include "ParameterParser.hpp"
#include "Parse.hpp"
#include "Tag.hpp"
#include "Utility.hpp"

namespace fs = std::filesystem;

void Runner::runPipeline(int argc, const char *const argv[]) {  // NOLINT
    const auto parameters = ParameterParser::getParameters(argc, argv);

    try {
        std::visit(Pipeline(), parameters);
    } catch (const std::exception &e) {
        Logger::log(LogLevel::ERROR, std::string(e.what()));
    }
}

void Runner::runCountPipeline(const CountParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running count pipeline");

    const auto data = CountData(parameters.outputDir, parameters.fastqDir, parameters.layout);

    runTagAndSortStages(parameters, data);

    if (fs::exists(data.output.correctedAlignmentsPath)) {
        Logger::log(LogLevel::INFO, "Existing corrected alignments found: ",
                    data.output.correctedAlignmentsPath);
    } else {
        const auto pipeline = correct::Correct(parameters);
        pipeline.process(data.output.sortedAlignmentsPath, data.output.correctedAlignmentsPath);
    }

    const auto countPipeline = count::Count(parameters);
    countPipeline.process(data.output.correctedAlignmentsPath, data.output.readMatrixDir,
                          data.output.umiMatrixDir);

    Logger::log(LogLevel::INFO, "Count pipeline finished");
}

void Runner::runTagAndSortStages(const CountParameters &parameters, const CountData &data) {
    const CountOutput &output = data.output;

    if (fs::exists(output.sortedAlignmentsPath)) {
        Logger::log(LogLevel::INFO, "Existing sorted alignments found: ",
                    output.sortedAlignmentsPath);
        return;
    }

    if (fs::exists(output.taggedAlignmentsPath)) {
        Logger::log(LogLevel::INFO, "Existing tagged alignments found: ",
                    output.taggedAlignmentsPath);
    } else {
        const auto alignPipeline = align::Align(parameters);
        alignPipeline.process(data);

        const auto tagPipeline = tag::Tag(parameters);
        tagPipeline.process(data);

        helper::deleteDir(output.starDir);
    }

    const fs::path partialPath = output.sortedAlignmentsPath.parent_path() /
                                 (output.sortedAlignmentsPath.stem().string() + ".partial.bam");

    const auto sorter = sort::AlignmentSorter(parameters.chunkSize);
    sorter.sortByCoordinate(output.taggedAlignmentsPath, partialPath,
                            parameters.outputDir / "tmp_sort");
    fs::rename(partialPath, output.sortedAlignmentsPath);

    sort::AlignmentSorter::buildIndex(output.sortedAlignmentsPath);

    fs::remove(output.taggedAlignmentsPath);
}

void Runner::runParsePipeline(const ParseParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running parse pipeline");

    const auto pipeline = parse::Parse(parameters);
    pipeline.process();
}

void Runner::Pipeline::operator()(const CountParameters &params) {
    Runner::runCountPipeline(params);
};
void Runner::Pipeline::operator()(const ParseParameters &params) {
    Runner::runParsePipeline(params);
};
