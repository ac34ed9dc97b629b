#pragma once

// Standard
#include <optional>
#include <string>

// seqan3
#include <seqan3/io/sam_file/sam_tag_dictionary.hpp>

namespace pipelines::barcodes {

/**
 * Builds the key that identifies the barcode of a tagged record in the count matrices:
 * "<cell barcode pair>:<length of the first spacer>:<sample barcode>". The spacer length tells
 * apart the frame-shifted variants of the first spacer.
 *
 * @return The key, or std::nullopt if the record lacks one of the CB, FB or SB tags.
 */
auto completeBarcodeKey(const seqan3::sam_tag_dictionary &tagDictionary)
    -> std::optional<std::string>;

}  // namespace pipelines::barcodes
