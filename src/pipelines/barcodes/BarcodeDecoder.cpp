#include "BarcodeDecoder.hpp"

// Standard
#include <algorithm>
#include <cctype>
#include <fstream>
#include <ranges>
#include <stdexcept>
#include <tuple>

// seqan3
#include <seqan3/alignment/configuration/align_config_edit.hpp>
#include <seqan3/alignment/configuration/align_config_method.hpp>
#include <seqan3/alignment/configuration/align_config_output.hpp>
#include <seqan3/alignment/pairwise/align_pairwise.hpp>

// Internal
#include "Logger.hpp"
#include "Utility.hpp"

namespace pipelines::barcodes {

namespace {
auto toSequences(const std::vector<std::string> &whitelist) -> std::vector<seqan3::dna5_vector> {
    if (whitelist.empty()) {
        throw std::invalid_argument("Barcode whitelist is empty");
    }

    std::vector<seqan3::dna5_vector> sequences;
    sequences.reserve(whitelist.size());
    for (const auto &barcode : whitelist) {
        sequences.push_back(helper::toDna5(barcode));
    }
    return sequences;
}
}  // namespace

BarcodeDecoder::BarcodeDecoder(std::vector<std::string> whitelist, size_t maxErrors)
    : whitelist(std::move(whitelist)),
      whitelistSequences(toSequences(this->whitelist)),
      maxErrors(maxErrors) {}

auto BarcodeDecoder::loadWhitelist(const fs::path &whitelistPath) -> std::vector<std::string> {
    std::ifstream whitelistFile(whitelistPath);
    if (!whitelistFile.is_open()) {
        throw std::runtime_error("Could not open barcode whitelist: " + whitelistPath.string());
    }

    std::vector<std::string> whitelist;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(whitelistFile, line)) {
        ++lineNumber;
        std::erase_if(line, [](unsigned char c) { return std::isspace(c); });
        if (line.empty()) {
            continue;
        }

        const std::string barcode = normalize(line);
        if (!std::ranges::all_of(barcode, [](char base) {
                return base == 'A' || base == 'C' || base == 'G' || base == 'T';
            })) {
            throw std::runtime_error("Invalid barcode in " + whitelistPath.string() + " (line " +
                                     std::to_string(lineNumber) + "): " + line);
        }
        whitelist.push_back(barcode);
    }

    if (whitelist.empty()) {
        throw std::runtime_error("No barcodes found in whitelist: " + whitelistPath.string());
    }

    Logger::log(LogLevel::DEBUG, "Loaded ", whitelist.size(), " barcodes from ", whitelistPath);

    return whitelist;
}

auto BarcodeDecoder::normalize(const std::string &rawFragment) -> std::string {
    std::string fragment = rawFragment;
    std::ranges::transform(fragment, fragment.begin(), [](unsigned char c) {
        const char base = static_cast<char>(std::toupper(c));
        return base == 'N' ? 'A' : base;
    });
    return fragment;
}

auto BarcodeDecoder::editDistance(const seqan3::dna5_vector &lhs, const seqan3::dna5_vector &rhs)
    -> size_t {
    const auto config = seqan3::align_cfg::method_global{} | seqan3::align_cfg::edit_scheme |
                        seqan3::align_cfg::output_score{};

    int score = 0;
    for (const auto &result : seqan3::align_pairwise(std::tie(lhs, rhs), config)) {
        score = result.score();
    }

    return static_cast<size_t>(-score);
}

auto BarcodeDecoder::decode(const std::string &rawFragment) -> std::optional<std::string> {
    const std::string fragment = normalize(rawFragment);

    if (const auto memorized = decoded.find(fragment); memorized != decoded.end()) {
        return memorized->second;
    }

    const DistanceRanking ranking = rank(helper::toDna5(fragment));

    std::optional<std::string> barcode = std::nullopt;
    if (accepts(ranking)) {
        barcode = whitelist[ranking.bestIndex];
    }

    decoded.emplace(fragment, barcode);
    return barcode;
}

auto BarcodeDecoder::accepts(const DistanceRanking &ranking) const -> bool {
    return ranking.bestDistance <= maxErrors;
}

auto BarcodeDecoder::rank(const seqan3::dna5_vector &fragment) const -> DistanceRanking {
    DistanceRanking ranking;

    for (size_t i = 0; i < whitelistSequences.size(); ++i) {
        const size_t distance = editDistance(fragment, whitelistSequences[i]);
        if (distance < ranking.bestDistance) {
            ranking.secondBestDistance = ranking.bestDistance;
            ranking.bestDistance = distance;
            ranking.bestIndex = i;
        } else if (distance < ranking.secondBestDistance) {
            ranking.secondBestDistance = distance;
        }
    }

    return ranking;
}

SampleBarcodeDecoder::SampleBarcodeDecoder(std::vector<std::string> whitelist, size_t maxErrors,
                                           size_t rejectDelta)
    : BarcodeDecoder(std::move(whitelist), maxErrors), rejectDelta(rejectDelta) {}

auto SampleBarcodeDecoder::accepts(const DistanceRanking &ranking) const -> bool {
    if (!BarcodeDecoder::accepts(ranking)) {
        return false;
    }

    // A single-entry whitelist has no competitor.
    if (ranking.secondBestDistance == std::numeric_limits<size_t>::max()) {
        return true;
    }

    return ranking.secondBestDistance - ranking.bestDistance > rejectDelta;
}

}  // namespace pipelines::barcodes
