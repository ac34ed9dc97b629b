#pragma once

// seqan3
#include <seqan3/io/sequence_file/input.hpp>
#include <seqan3/io/sequence_file/output.hpp>

// Internal
#include "SamRecord.hpp"

namespace dataTypes {

using FastqInput = seqan3::sequence_file_input<>;

using FastqRecord = FastqInput::record_type;

/**
 * A barcode read together with the independently aligned record of its mate.
 */
struct RecordPair {
    FastqRecord barcodeRecord;
    SamRecord alignedRecord;
};

}  // namespace dataTypes
