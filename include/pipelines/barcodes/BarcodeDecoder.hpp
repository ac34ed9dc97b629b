#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>

namespace pipelines::barcodes {

namespace fs = std::filesystem;

/**
 * Maps a sequenced barcode fragment to the closest entry of a whitelist, measured by edit
 * distance. The best entry is accepted if it is within the configured number of errors; ties keep
 * the entry listed first.
 *
 * A decoder memorizes the fragments it has seen and is therefore owned by a single worker.
 */
class BarcodeDecoder {
   public:
    BarcodeDecoder(std::vector<std::string> whitelist, size_t maxErrors);
    BarcodeDecoder(const BarcodeDecoder &) = default;
    BarcodeDecoder(BarcodeDecoder &&) = default;
    auto operator=(const BarcodeDecoder &) -> BarcodeDecoder & = delete;
    auto operator=(BarcodeDecoder &&) -> BarcodeDecoder & = delete;
    virtual ~BarcodeDecoder() = default;

    /**
     * Reads a whitelist file with one barcode per line, blank lines are skipped.
     *
     * @throws std::runtime_error if the file can not be read or contains no valid barcode.
     */
    static auto loadWhitelist(const fs::path &whitelistPath) -> std::vector<std::string>;

    /**
     * Upper-cases a raw fragment and replaces undetermined bases by 'A', as done for whitelist
     * lookups.
     */
    static auto normalize(const std::string &rawFragment) -> std::string;

    static auto editDistance(const seqan3::dna5_vector &lhs, const seqan3::dna5_vector &rhs)
        -> size_t;

    /**
     * @return The whitelist entry the fragment decodes to, or std::nullopt if no entry is close
     * enough (or, for sample barcodes, the call is ambiguous).
     */
    auto decode(const std::string &rawFragment) -> std::optional<std::string>;

    auto getMaxErrors() const -> size_t { return maxErrors; }
    auto getWhitelist() const -> const std::vector<std::string> & { return whitelist; }

   protected:
    struct DistanceRanking {
        size_t bestIndex{0};
        size_t bestDistance{std::numeric_limits<size_t>::max()};
        size_t secondBestDistance{std::numeric_limits<size_t>::max()};
    };

    virtual auto accepts(const DistanceRanking &ranking) const -> bool;

   private:
    const std::vector<std::string> whitelist;
    const std::vector<seqan3::dna5_vector> whitelistSequences;
    const size_t maxErrors;

    std::unordered_map<std::string, std::optional<std::string>> decoded;

    auto rank(const seqan3::dna5_vector &fragment) const -> DistanceRanking;
};

/**
 * Decoder for sample barcodes, which additionally rejects a fragment when the second closest
 * whitelist entry is at most rejectDelta edits further away than the closest one.
 */
class SampleBarcodeDecoder : public BarcodeDecoder {
   public:
    SampleBarcodeDecoder(std::vector<std::string> whitelist, size_t maxErrors, size_t rejectDelta);

    auto getRejectDelta() const -> size_t { return rejectDelta; }

   protected:
    auto accepts(const DistanceRanking &ranking) const -> bool override;

   private:
    const size_t rejectDelta;
};

}  // namespace pipelines::barcodes
