#include "Layout.hpp"

// Standard
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string_view>

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

namespace pipelines::barcodes {

auto LayoutSegment::length(size_t variantIndex) const -> size_t {
    return isWildcard() ? wildcardLength : variants.at(variantIndex).size();
}

auto Layout::parse(const std::string &description) -> Layout {
    Layout layout;

    std::stringstream descriptionStream(description);
    std::string token;
    while (std::getline(descriptionStream, token, constants::layout::segmentSeparator)) {
        std::erase_if(token, [](unsigned char c) { return std::isspace(c); });
        layout.segments.push_back(parseSegment(token));
    }

    if (layout.segments.empty()) {
        throw std::invalid_argument("Layout description is empty");
    }

    return layout;
}

auto Layout::parseSegment(const std::string &token) -> LayoutSegment {
    if (token.empty()) {
        throw std::invalid_argument("Layout contains an empty segment");
    }

    auto isWildcardBase = [](char base) { return base == 'N' || base == 'n'; };

    if (std::ranges::all_of(token, isWildcardBase)) {
        return LayoutSegment{.wildcardLength = token.size(), .variants = {}};
    }

    if (isWildcardBase(token.front()) &&
        std::all_of(token.begin() + 1, token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        const size_t length = std::stoul(token.substr(1));
        if (length == 0) {
            throw std::invalid_argument("Wildcard segment of length zero: " + token);
        }
        return LayoutSegment{.wildcardLength = length, .variants = {}};
    }

    LayoutSegment segment;
    std::stringstream variantStream(token);
    std::string variant;
    while (std::getline(variantStream, variant, constants::layout::variantSeparator)) {
        const bool isNucleotide = !variant.empty() && std::ranges::all_of(variant, [](char base) {
            return std::string_view{"ACGTNacgtn"}.find(base) != std::string_view::npos;
        });
        if (!isNucleotide) {
            throw std::invalid_argument("Invalid literal variant '" + variant +
                                        "' in layout segment: " + token);
        }
        segment.variants.push_back(helper::toDna5(variant));
    }

    if (segment.variants.empty()) {
        throw std::invalid_argument("Literal segment without variants: " + token);
    }

    return segment;
}

auto Layout::variantCombinations() const -> std::vector<std::vector<size_t>> {
    std::vector<std::vector<size_t>> combinations{std::vector<size_t>(segments.size(), 0)};

    // Expanding from the last segment to the first keeps the first segment slowest changing.
    for (size_t segmentIndex = segments.size(); segmentIndex-- > 0;) {
        const auto &segment = segments[segmentIndex];
        if (segment.variants.size() < 2) {
            continue;
        }

        std::vector<std::vector<size_t>> expanded;
        expanded.reserve(combinations.size() * segment.variants.size());
        for (size_t variantIndex = 0; variantIndex < segment.variants.size(); ++variantIndex) {
            for (auto combination : combinations) {
                combination[segmentIndex] = variantIndex;
                expanded.push_back(std::move(combination));
            }
        }
        combinations = std::move(expanded);
    }

    return combinations;
}

auto operator<<(std::ostream &outputStream, const Layout &layout) -> std::ostream & {
    for (size_t i = 0; i < layout.segments.size(); ++i) {
        const auto &segment = layout.segments[i];
        if (i > 0) {
            outputStream << constants::layout::segmentSeparator;
        }
        if (segment.isWildcard()) {
            outputStream << 'N' << segment.wildcardLength;
            continue;
        }
        for (size_t j = 0; j < segment.variants.size(); ++j) {
            if (j > 0) {
                outputStream << constants::layout::variantSeparator;
            }
            outputStream << helper::toString(segment.variants[j]);
        }
    }
    return outputStream;
}

}  // namespace pipelines::barcodes
