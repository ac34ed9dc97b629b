#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <utility>

namespace pipelines::count {

/**
 * Sparse integer matrix with a fixed shape. Entries that were never added are zero.
 */
class CountMatrix {
   public:
    CountMatrix(size_t rows, size_t cols) : rowCount(rows), colCount(cols) {}

    /**
     * @throws std::out_of_range if the position lies outside the matrix.
     */
    void add(size_t row, size_t col, uint64_t value);

    auto at(size_t row, size_t col) const -> uint64_t;

    auto rows() const -> size_t { return rowCount; }
    auto cols() const -> size_t { return colCount; }
    auto nonZeroCount() const -> size_t { return entries.size(); }

    auto transposed() const -> CountMatrix;

    /**
     * Writes the matrix in MatrixMarket coordinate format with 1-based indices, entries ordered
     * by column, then row.
     */
    void writeMatrixMarket(std::ostream &out) const;

   private:
    size_t rowCount;
    size_t colCount;
    // Keyed by (col, row) so that iteration follows the column-major MatrixMarket order
    std::map<std::pair<size_t, size_t>, uint64_t> entries;
};

}  // namespace pipelines::count
