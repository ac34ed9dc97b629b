#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <utility>

// Internal
#include "CountMatrix.hpp"
#include "CountMatrixAssembler.hpp"
#include "CountParameters.hpp"

namespace pipelines::count {

namespace fs = std::filesystem;

/**
 * Builds the read and UMI count matrices of a corrected alignment file and writes them with
 * their labels, one directory per matrix.
 */
class Count {
   public:
    explicit Count(CountParameters params) : parameters(std::move(params)) {};
    ~Count() = default;

    /**
     * Writes the matrix directories that do not exist yet, skipped if both exist.
     */
    void process(const fs::path &correctedAlignmentsPath, const fs::path &readMatrixDir,
                 const fs::path &umiMatrixDir) const;

    /**
     * Writes matrix.mtx.gz with complete barcodes as rows and references as columns, plus
     * barcodes.tsv.gz and features.tsv.gz.
     */
    static void writeMatrixDirectory(const fs::path &matrixDir, const CountMatrix &matrix,
                                     const CountMatrices &labels);

    /**
     * Aggregates the records of an alignment file in chunks of chunkSize records, counted by
     * threadCount workers in parallel.
     */
    static auto aggregateRecords(const fs::path &alignmentsPath, size_t chunkSize,
                                 size_t threadCount) -> CountMatrixAssembler;

   private:
    CountParameters parameters;
};

}  // namespace pipelines::count
