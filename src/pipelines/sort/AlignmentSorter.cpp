#include "AlignmentSorter.hpp"

// Standard
#include <algorithm>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

// seqan3
#include <seqan3/io/sam_file/input.hpp>
#include <seqan3/io/sam_file/output.hpp>

// htslib
#include <htslib/sam.h>

// Internal
#include "Logger.hpp"
#include "SamRecord.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::sort {

namespace {
auto referenceLengths(SamInput &alignmentsIn) -> std::vector<size_t> {
    std::vector<size_t> lengths;
    std::ranges::transform(alignmentsIn.header().ref_id_info, std::back_inserter(lengths),
                           [](const auto &info) { return std::get<0>(info); });
    return lengths;
}

void writeRun(std::vector<SamRecord> &records, const fs::path &runPath,
              const std::deque<std::string> &referenceIDs,
              const std::vector<size_t> &lengths) {
    std::ranges::stable_sort(records, coordinateLess);

    seqan3::sam_file_output runOut{runPath, referenceIDs, lengths, sam_field_ids{}};
    for (const auto &record : records) {
        runOut.push_back(record);
    }
    records.clear();
}
}  // namespace

void AlignmentSorter::sortByCoordinate(const fs::path &inputPath, const fs::path &outputPath,
                                       const fs::path &tmpDir) const {
    Logger::log(LogLevel::INFO, "Sorting alignments of ", inputPath);

    const helper::ScopedTmpDir runDir(tmpDir);

    SamInput alignmentsIn{inputPath};
    const std::deque<std::string> &referenceIDs = alignmentsIn.header().ref_ids();
    const std::vector<size_t> lengths = referenceLengths(alignmentsIn);

    std::vector<fs::path> runPaths;
    std::vector<SamRecord> run;
    run.reserve(recordsPerRun);

    for (auto &record : alignmentsIn) {
        run.push_back(std::move(record));
        if (run.size() == recordsPerRun) {
            runPaths.push_back(runDir.uniqueFilePath(".bam"));
            writeRun(run, runPaths.back(), referenceIDs, lengths);
        }
    }

    if (!run.empty() || runPaths.empty()) {
        runPaths.push_back(runDir.uniqueFilePath(".bam"));
        writeRun(run, runPaths.back(), referenceIDs, lengths);
    }

    Logger::log(LogLevel::DEBUG, "Merging ", runPaths.size(), " sorted runs");

    mergeSorted(reduceRuns(std::move(runPaths), runDir), outputPath);
}

auto AlignmentSorter::reduceRuns(std::vector<fs::path> runPaths,
                                 const helper::ScopedTmpDir &runDir) const
    -> std::vector<fs::path> {
    size_t pass = 0;
    while (runPaths.size() > mergeFanIn) {
        std::vector<fs::path> mergedPaths;
        mergedPaths.reserve((runPaths.size() + mergeFanIn - 1) / mergeFanIn);

        for (size_t begin = 0; begin < runPaths.size(); begin += mergeFanIn) {
            const size_t end = std::min(begin + mergeFanIn, runPaths.size());
            const std::vector<fs::path> batch(runPaths.begin() + begin, runPaths.begin() + end);

            mergedPaths.push_back(runDir.uniqueFilePath(".bam"));
            mergeSorted(batch, mergedPaths.back());

            for (const auto &runPath : batch) {
                fs::remove(runPath);
            }
        }

        Logger::log(LogLevel::DEBUG, "Merge pass ", pass, " reduced ", runPaths.size(), " runs to ",
                    mergedPaths.size());

        runPaths = std::move(mergedPaths);
        ++pass;
    }

    return runPaths;
}

void AlignmentSorter::mergeSorted(const std::vector<fs::path> &sortedPaths,
                                  const fs::path &outputPath) {
    if (sortedPaths.empty()) {
        throw std::invalid_argument("No sorted alignment files to merge into " +
                                    outputPath.string());
    }

    std::vector<std::unique_ptr<SamInput>> inputs;
    inputs.reserve(sortedPaths.size());
    for (const auto &sortedPath : sortedPaths) {
        inputs.push_back(std::make_unique<SamInput>(sortedPath));
    }

    const std::deque<std::string> &referenceIDs = inputs.front()->header().ref_ids();
    const std::vector<size_t> lengths = referenceLengths(*inputs.front());

    using InputIterator = std::ranges::iterator_t<SamInput>;
    std::vector<InputIterator> iterators;
    std::vector<std::optional<SamRecord>> heads(inputs.size());

    auto advance = [&](size_t inputIndex) {
        auto &iterator = iterators[inputIndex];
        if (iterator == inputs[inputIndex]->end()) {
            heads[inputIndex] = std::nullopt;
            return;
        }
        heads[inputIndex] = std::move(*iterator);
        ++iterator;
    };

    // Min-heap on coordinate, the input index breaks ties.
    auto greater = [&heads](size_t lhs, size_t rhs) {
        if (coordinateLess(heads[rhs].value(), heads[lhs].value())) {
            return true;
        }
        if (coordinateLess(heads[lhs].value(), heads[rhs].value())) {
            return false;
        }
        return lhs > rhs;
    };
    std::priority_queue<size_t, std::vector<size_t>, decltype(greater)> queue(greater);

    for (size_t i = 0; i < inputs.size(); ++i) {
        iterators.push_back(inputs[i]->begin());
        advance(i);
        if (heads[i].has_value()) {
            queue.push(i);
        }
    }

    seqan3::sam_file_output alignmentsOut{outputPath, referenceIDs, lengths, sam_field_ids{}};
    alignmentsOut.header().sorting = "coordinate";

    while (!queue.empty()) {
        const size_t inputIndex = queue.top();
        queue.pop();

        alignmentsOut.push_back(heads[inputIndex].value());

        advance(inputIndex);
        if (heads[inputIndex].has_value()) {
            queue.push(inputIndex);
        }
    }
}

void AlignmentSorter::buildIndex(const fs::path &bamPath) {
    const int result = sam_index_build(bamPath.c_str(), 0);
    if (result != 0) {
        throw std::runtime_error("Could not build index for " + bamPath.string() +
                                 " (htslib error " + std::to_string(result) + ")");
    }

    Logger::log(LogLevel::INFO, "Index written for ", bamPath);
}

}  // namespace pipelines::sort
