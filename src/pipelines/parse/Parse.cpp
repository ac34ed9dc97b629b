#include "Parse.hpp"

// Standard
#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>

// seqan3
#include <seqan3/io/sequence_file/input.hpp>
#include <seqan3/io/sequence_file/output.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"
#include "OrderedChunkProcessor.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::parse {

namespace {
// Shortest text that reads back to the same score, always with a decimal point or exponent
auto formatScore(const double score) -> std::string {
    std::array<char, 32> buffer{};
    const auto [end, errorCode] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), score);
    if (errorCode != std::errc{}) {
        throw std::runtime_error("Could not format layout score " + std::to_string(score));
    }

    std::string formatted(buffer.data(), end);
    if (formatted.find_first_of(".e") == std::string::npos) {
        formatted += ".0";
    }
    return formatted;
}
}  // namespace

void Parse::process() const {
    Logger::log(LogLevel::INFO, "Parsing barcode reads of ", parameters.fastqPath);

    FastqInput recordsIn{parameters.fastqPath};

    const fs::path parsedPath = outputPath();
    const fs::path partialPath =
        parsedPath.parent_path() / (parsedPath.stem().string() + ".partial.fastq");

    size_t recordCount = 0;
    {
        seqan3::sequence_file_output recordsOut{partialPath};

        const size_t chunkSize = parameters.chunkSize;
        auto recordIter = recordsIn.begin();
        auto nextChunk = [&]() -> std::optional<std::vector<FastqRecord>> {
            std::vector<FastqRecord> chunk;
            chunk.reserve(chunkSize);
            for (; recordIter != recordsIn.end() && chunk.size() < chunkSize; ++recordIter) {
                chunk.push_back(std::move(*recordIter));
            }

            if (chunk.empty()) {
                return std::nullopt;
            }
            return chunk;
        };

        const barcodes::Layout &layout = parameters.layout;
        auto parseChunk = [&layout](std::vector<FastqRecord> chunk) {
            return parseRecords(std::move(chunk), layout);
        };

        auto writeChunk = [&recordsOut, &recordCount](std::vector<FastqRecord> parsedRecords) {
            for (const auto &record : parsedRecords) {
                recordsOut.push_back(record);
            }
            recordCount += parsedRecords.size();
        };

        const tag::OrderedChunkProcessor processor(parameters.threadCount);
        processor.run(nextChunk, parseChunk, writeChunk);
    }

    fs::rename(partialPath, parsedPath);

    Logger::log(LogLevel::INFO, "Parsed ", recordCount, " reads into ", parsedPath);
}

auto Parse::outputPath() const -> fs::path {
    return parameters.outputDir /
           (getFastqStem(parameters.fastqPath) + constants::files::parsedFastqSuffix);
}

auto Parse::parsedRecordName(const barcodes::LayoutAlignment &alignment,
                             std::string_view identifier) -> std::string {
    std::ostringstream name;
    for (size_t i = 0; i < alignment.pieces.size(); ++i) {
        if (i > 0) {
            name << constants::layout::segmentSeparator;
        }
        name << alignment.pieces[i];
    }
    name << '/' << formatScore(alignment.normalizedScore) << '/' << helper::firstToken(identifier);
    return name.str();
}

auto Parse::parseRecords(std::vector<FastqRecord> records, const barcodes::Layout &layout)
    -> std::vector<FastqRecord> {
    const barcodes::LayoutAligner aligner(layout);

    for (auto &record : records) {
        const barcodes::LayoutAlignment alignment = aligner.align(record.sequence());

        record.id() = parsedRecordName(alignment, record.id());

        const size_t begin = std::min(alignment.endPosition, record.sequence().size());
        record.sequence().erase(record.sequence().begin(), record.sequence().begin() + begin);

        const size_t qualityBegin = std::min(begin, record.base_qualities().size());
        record.base_qualities().erase(record.base_qualities().begin(),
                                      record.base_qualities().begin() + qualityBegin);
    }

    return records;
}

}  // namespace pipelines::parse
