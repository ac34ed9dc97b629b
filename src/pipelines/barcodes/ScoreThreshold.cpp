#include "ScoreThreshold.hpp"

// Standard
#include <cmath>
#include <limits>
#include <numeric>

namespace pipelines::barcodes {

auto ScoreThreshold::estimate(const std::vector<double> &scores) -> double {
    if (scores.empty()) {
        return std::numeric_limits<double>::lowest();
    }

    const double count = static_cast<double>(scores.size());
    const double mean = std::accumulate(scores.begin(), scores.end(), 0.0) / count;

    const double squaredDeviations =
        std::accumulate(scores.begin(), scores.end(), 0.0, [mean](double sum, double score) {
            return sum + (score - mean) * (score - mean);
        });
    const double standardDeviation = std::sqrt(squaredDeviations / count);

    return mean - 2.0 * standardDeviation;
}

}  // namespace pipelines::barcodes
