#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <vector>

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

namespace pipelines::sort {

namespace fs = std::filesystem;

/**
 * Sorts BAM files by coordinate with an external merge sort: runs of at most recordsPerRun
 * records are sorted in memory and written to a temporary directory, then merged. No more than
 * mergeFanIn runs are opened at a time, larger run sets are merged in several passes.
 */
class AlignmentSorter {
   public:
    explicit AlignmentSorter(size_t recordsPerRun,
                             size_t mergeFanIn = constants::pipelines::defaultMergeFanIn)
        : recordsPerRun(recordsPerRun == 0 ? 1 : recordsPerRun),
          mergeFanIn(mergeFanIn < 2 ? 2 : mergeFanIn) {}

    /**
     * @param tmpDir Directory for the sorted runs, removed when sorting ends.
     */
    void sortByCoordinate(const fs::path &inputPath, const fs::path &outputPath,
                          const fs::path &tmpDir) const;

    /**
     * Merges coordinate sorted BAM files sharing the same references into one sorted file in a
     * single pass. Records at equal coordinates keep the order of the input files.
     */
    static void mergeSorted(const std::vector<fs::path> &sortedPaths, const fs::path &outputPath);

    /**
     * Writes the BAI index next to a coordinate sorted BAM file.
     *
     * @throws std::runtime_error if htslib fails to build the index.
     */
    static void buildIndex(const fs::path &bamPath);

   private:
    const size_t recordsPerRun;
    const size_t mergeFanIn;

    /**
     * Merges consecutive batches of mergeFanIn runs into new runs inside runDir until at most
     * mergeFanIn runs are left. Consumed runs are deleted.
     */
    auto reduceRuns(std::vector<fs::path> runPaths, const helper::ScopedTmpDir &runDir) const
        -> std::vector<fs::path>;
};

}  // namespace pipelines::sort
