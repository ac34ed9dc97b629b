#pragma once

// Standard
#include <cstddef>
#include <string>
#include <vector>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>

// Internal
#include "Layout.hpp"

namespace pipelines::barcodes {

struct LayoutAlignment {
    double normalizedScore{0.0};
    std::vector<std::string> pieces;
    size_t endPosition{0};
    std::vector<size_t> variantIndices;
};

class LayoutAligner {
   public:
    explicit LayoutAligner(Layout layout);

    /**
     * Segments a raw read into the pieces of the layout. Every combination of literal variants is
     * placed greedily from the start of the read; the combination with the highest fraction of
     * matching literal bases wins, ties keep the combination found first.
     *
     * Reads shorter than the layout are clamped: truncated pieces are returned and missing literal
     * bases count as mismatches.
     *
     * @param sequence The raw read.
     * @return The best segmentation with one piece per layout segment.
     */
    auto align(const seqan3::dna5_vector &sequence) const -> LayoutAlignment;

    auto getLayout() const -> const Layout & { return layout; }

   private:
    Layout layout;
    std::vector<std::vector<size_t>> combinations;

    auto place(const seqan3::dna5_vector &sequence, const std::vector<size_t> &combination) const
        -> LayoutAlignment;
};

}  // namespace pipelines::barcodes
