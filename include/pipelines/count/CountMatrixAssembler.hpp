#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

// Internal
#include "CountMatrix.hpp"
#include "SamRecord.hpp"

namespace pipelines::count {

/**
 * Read and UMI counts indexed by (reference, complete barcode). The labels give the meaning of
 * the rows (references, in header order) and columns (complete barcodes, sorted).
 */
struct CountMatrices {
    std::vector<std::string> referenceLabels;
    std::vector<std::string> barcodeLabels;
    CountMatrix readCounts;
    CountMatrix umiCounts;
};

/**
 * Aggregates reads per reference, complete barcode and corrected UMI. Workers fill their own
 * assembler from the reference groups they process, the coordinator merges them with += and
 * assembles the matrices once.
 */
class CountMatrixAssembler {
   public:
    using UmiReadCounts = std::map<std::string, uint64_t>;
    using BarcodeCounts = std::map<std::string, UmiReadCounts>;

    /**
     * Counts a record under its reference, complete barcode and UB tag.
     *
     * @return false if the record is unmapped or lacks one of the tags.
     */
    auto add(const dataTypes::SamRecord &record) -> bool;

    void add(size_t referenceIndex, const std::string &barcodeKey, const std::string &umi,
             uint64_t reads = 1);

    void operator+=(const CountMatrixAssembler &other);

    auto referenceCount() const -> size_t { return aggregates.size(); }

    /**
     * Enumerates the barcodes seen on any reference, then places the counts. The read count of
     * an entry is the sum of the reads of its UMIs, the UMI count the number of distinct UMIs.
     *
     * @throws std::out_of_range if a counted reference index has no label.
     */
    auto assemble(const std::deque<std::string> &referenceLabels) const -> CountMatrices;

   private:
    std::map<size_t, BarcodeCounts> aggregates;
};

}  // namespace pipelines::count
