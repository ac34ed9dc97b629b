#pragma once

// Standard
#include <vector>

namespace pipelines::barcodes {

struct ScoreThreshold {
    ScoreThreshold() = delete;

    /**
     * Estimates the acceptance cutoff for layout alignment scores as mean - 2 * standard
     * deviation (population) of a sample of scores.
     *
     * @param scores Normalized scores of the first records of an input.
     * @return The cutoff, or the lowest representable double for an empty sample.
     */
    static auto estimate(const std::vector<double> &scores) -> double;

    static auto passes(const double score, const double threshold) -> bool {
        return score >= threshold;
    }
};

}  // namespace pipelines::barcodes
