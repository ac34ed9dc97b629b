#pragma once

// Standard
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// seqan3
#include <seqan3/io/sam_file/sam_tag_dictionary.hpp>

using namespace seqan3::literals;

namespace tags {
// Cell barcode pair "bc1.bc2", corrected and raw
constexpr uint16_t cellBarcode = "CB"_tag;
constexpr uint16_t rawCellBarcode = "CR"_tag;
// Sample barcode, corrected and raw
constexpr uint16_t sampleBarcode = "SB"_tag;
constexpr uint16_t rawSampleBarcode = "SR"_tag;
// Filler (spacer) sequences "f1.f2", expected and raw
constexpr uint16_t filler = "FB"_tag;
constexpr uint16_t rawFiller = "FR"_tag;
// UMI as sequenced and after correction
constexpr uint16_t rawUmi = "UR"_tag;
constexpr uint16_t correctedUmi = "UB"_tag;

inline auto getString(const seqan3::sam_tag_dictionary &tagDictionary, const uint16_t tag)
    -> std::optional<std::string> {
    const auto iterator = tagDictionary.find(tag);
    if (iterator == tagDictionary.end() || !std::holds_alternative<std::string>(iterator->second)) {
        return std::nullopt;
    }
    return std::get<std::string>(iterator->second);
}

inline void setString(seqan3::sam_tag_dictionary &tagDictionary, const uint16_t tag,
                      std::string value) {
    tagDictionary[tag] = std::move(value);
}
}  // namespace tags
