#include "LayoutAligner.hpp"

// Standard
#include <algorithm>
#include <ranges>

// Internal
#include "Utility.hpp"

using seqan3::operator""_dna5;

namespace pipelines::barcodes {

LayoutAligner::LayoutAligner(Layout layout)
    : layout(std::move(layout)), combinations(this->layout.variantCombinations()) {}

auto LayoutAligner::align(const seqan3::dna5_vector &sequence) const -> LayoutAlignment {
    LayoutAlignment bestAlignment;
    bool hasAlignment = false;

    for (const auto &combination : combinations) {
        LayoutAlignment alignment = place(sequence, combination);
        if (!hasAlignment || alignment.normalizedScore > bestAlignment.normalizedScore) {
            bestAlignment = std::move(alignment);
            hasAlignment = true;
        }
    }

    return bestAlignment;
}

auto LayoutAligner::place(const seqan3::dna5_vector &sequence,
                          const std::vector<size_t> &combination) const -> LayoutAlignment {
    LayoutAlignment alignment;
    alignment.pieces.reserve(layout.size());
    alignment.variantIndices = combination;

    size_t position = 0;
    size_t matchingBases = 0;
    size_t literalBases = 0;

    for (size_t segmentIndex = 0; segmentIndex < layout.size(); ++segmentIndex) {
        const auto &segment = layout.segments[segmentIndex];
        const size_t variantIndex = combination[segmentIndex];
        const size_t segmentLength = segment.length(variantIndex);

        const size_t begin = std::min(position, sequence.size());
        const size_t end = std::min(position + segmentLength, sequence.size());
        const auto piece = std::ranges::subrange(sequence.begin() + begin, sequence.begin() + end);

        if (!segment.isWildcard()) {
            const auto &literal = segment.variants[variantIndex];
            literalBases += literal.size();
            for (size_t i = 0; i < piece.size(); ++i) {
                // An N in the read never counts as a match.
                if (piece[i] == literal[i] && piece[i] != 'N'_dna5) {
                    ++matchingBases;
                }
            }
        }

        alignment.pieces.push_back(helper::toString(piece));
        position += segmentLength;
    }

    alignment.endPosition = std::min(position, sequence.size());
    alignment.normalizedScore =
        literalBases == 0 ? 0.0
                          : static_cast<double>(matchingBases) / static_cast<double>(literalBases);

    return alignment;
}

}  // namespace pipelines::barcodes
