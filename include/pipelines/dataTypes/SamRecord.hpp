#pragma once

// Standard
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// seqan3
#include <seqan3/alphabet/cigar/cigar.hpp>
#include <seqan3/alphabet/nucleotide/dna5.hpp>
#include <seqan3/alphabet/quality/phred42.hpp>
#include <seqan3/io/record.hpp>
#include <seqan3/io/sam_file/input.hpp>
#include <seqan3/io/sam_file/record.hpp>
#include <seqan3/io/sam_file/sam_flag.hpp>
#include <seqan3/io/sam_file/sam_tag_dictionary.hpp>
#include <seqan3/utility/type_list/type_list.hpp>

namespace dataTypes {

using sam_field_types =
    seqan3::type_list<std::string, seqan3::sam_flag, std::optional<int32_t>, std::optional<int32_t>,
                      uint8_t, std::vector<seqan3::cigar>, seqan3::dna5_vector,
                      std::vector<seqan3::phred42>, seqan3::sam_tag_dictionary>;

using sam_field_ids =
    seqan3::fields<seqan3::field::id, seqan3::field::flag, seqan3::field::ref_id,
                   seqan3::field::ref_offset, seqan3::field::mapq, seqan3::field::cigar,
                   seqan3::field::seq, seqan3::field::qual, seqan3::field::tags>;

using SamRecord = seqan3::sam_record<sam_field_types, sam_field_ids>;

using SamInput = seqan3::sam_file_input<seqan3::sam_file_input_default_traits<>, sam_field_ids>;

/**
 * Coordinate order of alignment records: by reference index, then by position. Records without a
 * reference (unmapped) sort after all mapped records, as in a coordinate sorted BAM file.
 */
inline auto coordinateLess(const SamRecord& lhs, const SamRecord& rhs) -> bool {
    const auto& lhsReferenceID = lhs.reference_id();
    const auto& rhsReferenceID = rhs.reference_id();

    if (lhsReferenceID.has_value() != rhsReferenceID.has_value()) {
        return lhsReferenceID.has_value();
    }

    if (lhsReferenceID != rhsReferenceID) {
        return lhsReferenceID.value() < rhsReferenceID.value();
    }

    return lhs.reference_position().value_or(-1) < rhs.reference_position().value_or(-1);
}

}  // namespace dataTypes
