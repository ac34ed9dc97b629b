#include "BarcodeTagger.hpp"

// Internal
#include "Constants.hpp"
#include "CustomSamTags.hpp"
#include "ScoreThreshold.hpp"
#include "Utility.hpp"

namespace pipelines::barcodes {

auto operator<<(std::ostream &outputStream, const FilterReason &reason) -> std::ostream & {
    switch (reason) {
        case FilterReason::LOW_SCORE:
            return outputStream << "low score";
        case FilterReason::UNDECODABLE_BARCODE:
            return outputStream << "undecodable barcode";
        case FilterReason::UNDECODABLE_SAMPLE_BARCODE:
            return outputStream << "undecodable sample barcode";
    }
    return outputStream;
}

void BarcodeTags::applyTo(seqan3::sam_tag_dictionary &tagDictionary) const {
    tags::setString(tagDictionary, tags::cellBarcode, cellBarcode);
    tags::setString(tagDictionary, tags::rawCellBarcode, rawCellBarcode);
    tags::setString(tagDictionary, tags::sampleBarcode, sampleBarcode);
    tags::setString(tagDictionary, tags::rawSampleBarcode, rawSampleBarcode);
    tags::setString(tagDictionary, tags::filler, filler);
    tags::setString(tagDictionary, tags::rawFiller, rawFiller);
    tags::setString(tagDictionary, tags::rawUmi, rawUmi);
}

BarcodeTagger::BarcodeTagger(const BarcodeConfig &config)
    : aligner(config.layout),
      barcodeDecoder(config.barcodeWhitelist, config.maxBarcodeErrors),
      sampleBarcodeDecoder(config.sampleBarcodeWhitelist, config.maxSampleBarcodeErrors,
                           config.sampleBarcodeRejectDelta) {
    BarcodeConfig::validateLayout(config.layout);
}

auto BarcodeTagger::score(const seqan3::dna5_vector &barcodeSequence) const -> double {
    return aligner.align(barcodeSequence).normalizedScore;
}

auto BarcodeTagger::process(const seqan3::dna5_vector &barcodeSequence, const double threshold)
    -> TaggingOutcome {
    using namespace constants::layout;

    const LayoutAlignment alignment = aligner.align(barcodeSequence);

    if (!ScoreThreshold::passes(alignment.normalizedScore, threshold)) {
        return FilterReason::LOW_SCORE;
    }

    const auto &pieces = alignment.pieces;

    const auto firstBarcode = barcodeDecoder.decode(pieces[firstCellBarcodeSegment]);
    const auto secondBarcode = barcodeDecoder.decode(pieces[secondCellBarcodeSegment]);
    if (!firstBarcode.has_value() || !secondBarcode.has_value()) {
        return FilterReason::UNDECODABLE_BARCODE;
    }

    const auto sampleBarcode = sampleBarcodeDecoder.decode(pieces[sampleBarcodeSegment]);
    if (!sampleBarcode.has_value()) {
        return FilterReason::UNDECODABLE_SAMPLE_BARCODE;
    }

    return BarcodeTags{
        .cellBarcode = firstBarcode.value() + pieceSeparator + secondBarcode.value(),
        .rawCellBarcode =
            pieces[firstCellBarcodeSegment] + pieceSeparator + pieces[secondCellBarcodeSegment],
        .sampleBarcode = sampleBarcode.value(),
        .rawSampleBarcode = pieces[sampleBarcodeSegment],
        .filler = filler(alignment, firstFillerSegment) + pieceSeparator +
                  filler(alignment, secondFillerSegment),
        .rawFiller = pieces[firstFillerSegment] + pieceSeparator + pieces[secondFillerSegment],
        .rawUmi = pieces[umiSegment]};
}

auto BarcodeTagger::filler(const LayoutAlignment &alignment, size_t segmentIndex) const
    -> std::string {
    const auto &segment = aligner.getLayout().segments[segmentIndex];
    return helper::toString(segment.variants[alignment.variantIndices[segmentIndex]]);
}

}  // namespace pipelines::barcodes
