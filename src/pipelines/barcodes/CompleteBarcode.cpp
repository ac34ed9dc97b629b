#include "CompleteBarcode.hpp"

// Internal
#include "Constants.hpp"
#include "CustomSamTags.hpp"

namespace pipelines::barcodes {

auto completeBarcodeKey(const seqan3::sam_tag_dictionary &tagDictionary)
    -> std::optional<std::string> {
    const auto cellBarcode = tags::getString(tagDictionary, tags::cellBarcode);
    const auto filler = tags::getString(tagDictionary, tags::filler);
    const auto sampleBarcode = tags::getString(tagDictionary, tags::sampleBarcode);

    if (!cellBarcode.has_value() || !filler.has_value() || !sampleBarcode.has_value()) {
        return std::nullopt;
    }

    const size_t firstFillerLength = filler->find(constants::layout::pieceSeparator);

    return cellBarcode.value() + ":" +
           std::to_string(firstFillerLength == std::string::npos ? filler->size()
                                                                 : firstFillerLength) +
           ":" + sampleBarcode.value();
}

}  // namespace pipelines::barcodes
