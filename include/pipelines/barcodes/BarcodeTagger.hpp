#pragma once

// Standard
#include <ostream>
#include <string>
#include <variant>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>
#include <seqan3/io/sam_file/sam_tag_dictionary.hpp>

// Internal
#include "BarcodeConfig.hpp"
#include "BarcodeDecoder.hpp"
#include "LayoutAligner.hpp"

namespace pipelines::barcodes {

enum class FilterReason { LOW_SCORE, UNDECODABLE_BARCODE, UNDECODABLE_SAMPLE_BARCODE };

auto operator<<(std::ostream &outputStream, const FilterReason &reason) -> std::ostream &;

/**
 * Barcode information extracted from one barcode read. Pairs are joined by '.'.
 */
struct BarcodeTags {
    std::string cellBarcode;
    std::string rawCellBarcode;
    std::string sampleBarcode;
    std::string rawSampleBarcode;
    std::string filler;
    std::string rawFiller;
    std::string rawUmi;

    void applyTo(seqan3::sam_tag_dictionary &tagDictionary) const;
};

using TaggingOutcome = std::variant<BarcodeTags, FilterReason>;

/**
 * Aligns barcode reads to the layout and decodes their barcodes. Owns its aligner and decoders,
 * one instance is used per worker.
 */
class BarcodeTagger {
   public:
    explicit BarcodeTagger(const BarcodeConfig &config);

    auto score(const seqan3::dna5_vector &barcodeSequence) const -> double;

    /**
     * Extracts the tags of a barcode read. The read is filtered if its layout score is below the
     * threshold or if a cell or sample barcode does not decode.
     */
    auto process(const seqan3::dna5_vector &barcodeSequence, const double threshold)
        -> TaggingOutcome;

    auto getAligner() const -> const LayoutAligner & { return aligner; }

   private:
    LayoutAligner aligner;
    BarcodeDecoder barcodeDecoder;
    SampleBarcodeDecoder sampleBarcodeDecoder;

    auto filler(const LayoutAlignment &alignment, size_t segmentIndex) const -> std::string;
};

}  // namespace pipelines::barcodes
