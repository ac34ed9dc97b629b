#include "Align.hpp"

// Standard
#include <stdexcept>

// Boost
#include <boost/process.hpp>

// Internal
#include "Logger.hpp"
#include "Utility.hpp"

namespace bp = boost::process;

namespace pipelines {
namespace align {

void Align::process(const CountData &data) const {
    fs::create_directories(data.output.starDir);

    const fs::path starExecutable = resolveExecutable();

    for (const auto &sample : data.samples) {
        if (fs::exists(sample.starAlignmentsPath)) {
            Logger::log(LogLevel::INFO, "Existing alignments found: ", sample.starAlignmentsPath);
            continue;
        }

        alignSample(sample, starExecutable);
    }
}

auto Align::starArguments(const CountSample &sample, const fs::path &genomeDir)
    -> std::vector<std::string> {
    std::vector<std::string> args = {"--runThreadN",
                                     "1",
                                     "--genomeDir",
                                     genomeDir.string(),
                                     "--readFilesIn",
                                     sample.genomicFastqPath.string(),
                                     "--outFileNamePrefix",
                                     sample.starPrefix.string(),
                                     "--outFilterMultimapNmax",
                                     "1",
                                     "--outSAMtype",
                                     "BAM",
                                     "Unsorted"};

    if (sample.genomicFastqPath.extension() == ".gz") {
        args.insert(args.end(), {"--readFilesCommand", "zcat"});
    }

    return args;
}

void Align::alignSample(const CountSample &sample, const fs::path &starExecutable) const {
    Logger::log(LogLevel::INFO, "Aligning reads of ", sample.sampleName, " with STAR");

    const std::vector<std::string> args = starArguments(sample, parameters.starReferenceDir);

    bp::ipstream errorStream;
    bp::child star(bp::exe = starExecutable.string(), bp::args = args, bp::std_out > bp::null,
                   bp::std_err > errorStream);

    std::string errorOutput;
    std::string line;
    while (std::getline(errorStream, line)) {
        Logger::log(LogLevel::DEBUG, "STAR: ", line);
        errorOutput += line + "\n";
    }

    star.wait();

    if (star.exit_code() != 0) {
        throw std::runtime_error("STAR failed for " + sample.genomicFastqPath.string() +
                                 " with exit code " + std::to_string(star.exit_code()) + ":\n" +
                                 errorOutput);
    }

    if (!fs::exists(sample.starAlignmentsPath)) {
        throw std::runtime_error("STAR did not write the expected alignments: " +
                                 sample.starAlignmentsPath.string());
    }

    Logger::log(LogLevel::INFO, "Alignments written to ", sample.starAlignmentsPath);
}

auto Align::resolveExecutable() const -> fs::path {
    const fs::path &executable = parameters.starExecutable;

    if (executable.has_parent_path()) {
        if (!fs::exists(executable)) {
            throw std::runtime_error("STAR executable not found: " + executable.string());
        }
        return executable;
    }

    const boost::filesystem::path searched = bp::search_path(executable.string());
    if (searched.empty()) {
        throw std::runtime_error("STAR executable not found in PATH: " + executable.string());
    }

    return fs::path(searched.string());
}

}  // namespace align
}  // namespace pipelines
