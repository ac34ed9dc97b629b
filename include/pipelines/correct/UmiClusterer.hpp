#pragma once

// Standard
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>

namespace pipelines::correct {

using UmiCounts = std::map<std::string, size_t>;
using UmiMapping = std::unordered_map<std::string, std::string>;

/**
 * Groups the UMIs observed for one barcode on one reference into molecules.
 */
class UmiClusterer {
   public:
    UmiClusterer() = default;
    UmiClusterer(const UmiClusterer &) = default;
    UmiClusterer(UmiClusterer &&) = default;
    auto operator=(const UmiClusterer &) -> UmiClusterer & = default;
    auto operator=(UmiClusterer &&) -> UmiClusterer & = default;
    virtual ~UmiClusterer() = default;

    /**
     * @param counts Number of reads per raw UMI.
     * @return For every raw UMI the UMI representing its molecule.
     */
    virtual auto cluster(const UmiCounts &counts) const -> UmiMapping = 0;
};

/**
 * Directional network clustering: UMIs are visited by decreasing read count (ties in
 * lexicographic order). Starting from every UMI not yet assigned, a breadth-first search follows
 * UMIs at Hamming distance one whose count c satisfies count(parent) >= 2c - 1, and assigns
 * them to the starting UMI.
 */
class DirectionalUmiClusterer : public UmiClusterer {
   public:
    auto cluster(const UmiCounts &counts) const -> UmiMapping override;

    static auto hammingDistance(const std::string &lhs, const std::string &rhs) -> size_t;
};

}  // namespace pipelines::correct
