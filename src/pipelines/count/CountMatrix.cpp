#include "CountMatrix.hpp"

// Standard
#include <stdexcept>
#include <string>

namespace pipelines::count {

void CountMatrix::add(size_t row, size_t col, uint64_t value) {
    if (row >= rowCount || col >= colCount) {
        throw std::out_of_range("Matrix position (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") outside of " + std::to_string(rowCount) +
                                " x " + std::to_string(colCount) + " matrix");
    }

    if (value == 0) {
        return;
    }

    entries[{col, row}] += value;
}

auto CountMatrix::at(size_t row, size_t col) const -> uint64_t {
    const auto iterator = entries.find({col, row});
    return iterator == entries.end() ? 0 : iterator->second;
}

auto CountMatrix::transposed() const -> CountMatrix {
    CountMatrix result(colCount, rowCount);
    for (const auto &[position, value] : entries) {
        result.entries.emplace(std::make_pair(position.second, position.first), value);
    }
    return result;
}

void CountMatrix::writeMatrixMarket(std::ostream &out) const {
    out << "%%MatrixMarket matrix coordinate integer general\n";
    out << "%\n";
    out << rowCount << ' ' << colCount << ' ' << entries.size() << '\n';

    for (const auto &[position, value] : entries) {
        out << position.second + 1 << ' ' << position.first + 1 << ' ' << value << '\n';
    }
}

}  // namespace pipelines::count
