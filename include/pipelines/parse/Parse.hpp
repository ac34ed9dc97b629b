#pragma once

// Standard
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Internal
#include "FastqRecord.hpp"
#include "LayoutAligner.hpp"
#include "ParseParameters.hpp"
#include "PipelineData.hpp"

namespace pipelines::parse {

namespace fs = std::filesystem;

/**
 * Segments every read of a barcode FASTQ file with the layout. Each read is renamed to
 * "<piece>,<piece>,.../<score>/<identifier>" and trimmed to the bases after the layout.
 */
class Parse : public PipelineData {
   public:
    explicit Parse(ParseParameters params) : parameters(std::move(params)) {};
    ~Parse() = default;

    void process() const;

    auto outputPath() const -> fs::path;

    static auto parsedRecordName(const barcodes::LayoutAlignment &alignment,
                                 std::string_view identifier) -> std::string;

    static auto parseRecords(std::vector<dataTypes::FastqRecord> records,
                             const barcodes::Layout &layout)
        -> std::vector<dataTypes::FastqRecord>;

   private:
    ParseParameters parameters;
};

}  // namespace pipelines::parse
