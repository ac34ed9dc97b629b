#pragma once

// Standard
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>

namespace pipelines::barcodes {

/**
 * One piece of the expected read structure. A segment without variants is a wildcard that
 * consumes exactly wildcardLength bases; otherwise it is a literal that is expected to match one
 * of its variants.
 */
struct LayoutSegment {
    size_t wildcardLength{0};
    std::vector<seqan3::dna5_vector> variants;

    [[nodiscard]] auto isWildcard() const -> bool { return variants.empty(); }
    [[nodiscard]] auto length(size_t variantIndex) const -> size_t;
};

struct Layout {
    std::vector<LayoutSegment> segments;

    /**
     * Parses a layout description of comma separated segments. "N<k>" or a run of k 'N' is a
     * wildcard of length k, any other token is a literal whose alternative variants are separated
     * by '|', e.g. "N9,GTCAG|TCAG,N9,N8".
     *
     * @throws std::invalid_argument if the description is empty or contains an invalid segment.
     */
    static auto parse(const std::string &description) -> Layout;

    [[nodiscard]] auto size() const -> size_t { return segments.size(); }

    /**
     * All combinations of literal variants in declaration order. Each combination holds one
     * variant index per segment (0 for wildcards); the variant of the earliest segment changes
     * slowest.
     */
    [[nodiscard]] auto variantCombinations() const -> std::vector<std::vector<size_t>>;

   private:
    static auto parseSegment(const std::string &token) -> LayoutSegment;
};

auto operator<<(std::ostream &outputStream, const Layout &layout) -> std::ostream &;

}  // namespace pipelines::barcodes
