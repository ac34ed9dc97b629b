#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <utility>

// Internal
#include "AsyncReferenceUmiCountBuffer.hpp"
#include "CountParameters.hpp"
#include "UmiClusterer.hpp"
#include "UmiCorrector.hpp"

namespace pipelines::correct {

namespace fs = std::filesystem;

using ReferenceCorrections = std::map<std::optional<int32_t>, UmiCorrector>;

/**
 * Adds corrected UMIs (UB) to a coordinate sorted, tagged alignment file in two streaming passes.
 * The first pass counts the raw UMIs per reference, workers cluster the counts of the references
 * they pull from the buffer. The second pass rewrites the records in input order with the
 * corrections of their reference and indexes the result.
 */
class Correct {
   public:
    explicit Correct(CountParameters params) : parameters(std::move(params)) {};
    ~Correct() = default;

    void process(const fs::path &sortedAlignmentsPath,
                 const fs::path &correctedAlignmentsPath) const;

    /**
     * Clusters the UMI counts of all references of an alignment file.
     *
     * @throws std::runtime_error if the records of a reference are not consecutive.
     */
    static auto collectCorrections(const fs::path &sortedAlignmentsPath, size_t threadCount)
        -> ReferenceCorrections;

    /**
     * Copies an alignment file record by record, setting the UB tag of every record whose
     * reference, complete barcode and raw UMI have a correction.
     *
     * @return Number of records that received a corrected UMI.
     */
    static auto writeCorrected(const fs::path &sortedAlignmentsPath, const fs::path &outputPath,
                               const ReferenceCorrections &corrections) -> size_t;

   private:
    struct Result {
        size_t processedReferences{0};
        size_t processedRecords{0};
        ReferenceCorrections corrections;

        void operator+=(Result &&other);
    };

    CountParameters parameters;

    static auto clusterReferences(AsyncReferenceUmiCountBufferType &umiCountBuffer) -> Result;
};

}  // namespace pipelines::correct
