#include "Count.hpp"

// Standard
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// seqan3
#include <seqan3/io/sam_file/input.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"
#include "OrderedChunkProcessor.hpp"
#include "SamRecord.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::count {

void Count::process(const fs::path &correctedAlignmentsPath, const fs::path &readMatrixDir,
                    const fs::path &umiMatrixDir) const {
    const bool readMatrixExists = fs::exists(readMatrixDir);
    const bool umiMatrixExists = fs::exists(umiMatrixDir);
    if (readMatrixExists && umiMatrixExists) {
        Logger::log(LogLevel::INFO, "Matrix output folders exist. Skipping count matrix build");
        return;
    }

    Logger::log(LogLevel::INFO, "Counting reads of ", correctedAlignmentsPath);

    const CountMatrixAssembler assembler =
        aggregateRecords(correctedAlignmentsPath, parameters.chunkSize, parameters.threadCount);

    const std::deque<std::string> referenceIDs = [&correctedAlignmentsPath]() {
        SamInput alignmentsIn{correctedAlignmentsPath};
        return alignmentsIn.header().ref_ids();
    }();
    const CountMatrices matrices = assembler.assemble(referenceIDs);

    Logger::log(LogLevel::INFO, "Found ", matrices.barcodeLabels.size(), " barcodes on ",
                assembler.referenceCount(), " of ", referenceIDs.size(), " references");

    if (readMatrixExists) {
        Logger::log(LogLevel::INFO, "Keeping existing raw read count matrix ", readMatrixDir);
    } else {
        Logger::log(LogLevel::INFO, "Writing raw read count matrix...");
        writeMatrixDirectory(readMatrixDir, matrices.readCounts, matrices);
    }

    if (umiMatrixExists) {
        Logger::log(LogLevel::INFO, "Keeping existing raw UMI count matrix ", umiMatrixDir);
    } else {
        Logger::log(LogLevel::INFO, "Writing raw UMI count matrix...");
        writeMatrixDirectory(umiMatrixDir, matrices.umiCounts, matrices);
    }
}

void Count::writeMatrixDirectory(const fs::path &matrixDir, const CountMatrix &matrix,
                                 const CountMatrices &labels) {
    const fs::path partialDir = matrixDir.string() + ".partial";
    helper::deleteDir(partialDir);
    fs::create_directories(partialDir);

    const CountMatrix barcodeMatrix = matrix.transposed();
    helper::writeGzip(partialDir / constants::files::matrixFile,
                      [&barcodeMatrix](std::ostream &out) { barcodeMatrix.writeMatrixMarket(out); });
    helper::writeGzipLines(partialDir / constants::files::barcodesFile, labels.barcodeLabels);
    helper::writeGzipLines(partialDir / constants::files::featuresFile, labels.referenceLabels);

    fs::rename(partialDir, matrixDir);

    Logger::log(LogLevel::INFO, "Matrix written to ", matrixDir);
}

auto Count::aggregateRecords(const fs::path &alignmentsPath, size_t chunkSize,
                             size_t threadCount) -> CountMatrixAssembler {
    SamInput alignmentsIn{alignmentsPath};

    auto recordIter = alignmentsIn.begin();
    auto nextChunk = [&]() -> std::optional<std::vector<SamRecord>> {
        std::vector<SamRecord> chunk;
        chunk.reserve(chunkSize);
        for (; recordIter != alignmentsIn.end() && chunk.size() < chunkSize; ++recordIter) {
            chunk.push_back(std::move(*recordIter));
        }

        if (chunk.empty()) {
            return std::nullopt;
        }
        return chunk;
    };

    auto countChunk = [](std::vector<SamRecord> chunk) -> CountMatrixAssembler {
        CountMatrixAssembler chunkAssembler;
        for (const auto &record : chunk) {
            chunkAssembler.add(record);
        }
        return chunkAssembler;
    };

    CountMatrixAssembler assembler;
    const tag::OrderedChunkProcessor processor(threadCount);
    const size_t chunkCount = processor.run(
        nextChunk, countChunk,
        [&assembler](CountMatrixAssembler chunkAssembler) { assembler += chunkAssembler; });

    Logger::log(LogLevel::DEBUG, "Counted ", chunkCount, " chunks of ", alignmentsPath);

    return assembler;
}

}  // namespace pipelines::count
