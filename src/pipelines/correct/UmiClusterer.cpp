#include "UmiClusterer.hpp"

// Standard
#include <algorithm>
#include <limits>
#include <queue>
#include <utility>
#include <vector>

namespace pipelines::correct {

auto DirectionalUmiClusterer::hammingDistance(const std::string &lhs, const std::string &rhs)
    -> size_t {
    if (lhs.size() != rhs.size()) {
        return std::numeric_limits<size_t>::max();
    }

    size_t distance = 0;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i] != rhs[i]) {
            ++distance;
        }
    }
    return distance;
}

auto DirectionalUmiClusterer::cluster(const UmiCounts &counts) const -> UmiMapping {
    std::vector<std::pair<std::string, size_t>> umis(counts.begin(), counts.end());

    // UmiCounts is ordered by UMI, a stable sort keeps ties lexicographic.
    std::ranges::stable_sort(umis, [](const auto &lhs, const auto &rhs) {
        return lhs.second > rhs.second;
    });

    UmiMapping mapping;
    mapping.reserve(umis.size());

    for (size_t rootIndex = 0; rootIndex < umis.size(); ++rootIndex) {
        const std::string &root = umis[rootIndex].first;
        if (mapping.contains(root)) {
            continue;
        }

        mapping.emplace(root, root);

        std::queue<size_t> toVisit;
        toVisit.push(rootIndex);

        while (!toVisit.empty()) {
            const auto &[parent, parentCount] = umis[toVisit.front()];
            toVisit.pop();

            for (size_t childIndex = 0; childIndex < umis.size(); ++childIndex) {
                const auto &[child, childCount] = umis[childIndex];
                if (mapping.contains(child) || hammingDistance(parent, child) != 1) {
                    continue;
                }

                if (parentCount + 1 >= 2 * childCount) {
                    mapping.emplace(child, root);
                    toVisit.push(childIndex);
                }
            }
        }
    }

    return mapping;
}

}  // namespace pipelines::correct
