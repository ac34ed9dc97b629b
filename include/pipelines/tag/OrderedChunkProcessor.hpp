#pragma once

// Standard
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pipelines::tag {

/**
 * Runs a worker on consecutive chunks of a stream in parallel while handing the results to a sink
 * in the order the chunks were read. At most maxChunksInFlight chunks are processed at a time,
 * reading the next chunk blocks until the oldest one is consumed.
 *
 * The sink is only called from the thread that calls run(). A failing worker aborts the run: the
 * exception is rethrown with the chunk index once all chunks in flight have finished.
 */
class OrderedChunkProcessor {
   public:
    explicit OrderedChunkProcessor(const size_t maxChunksInFlight)
        : maxChunksInFlight(maxChunksInFlight == 0 ? 1 : maxChunksInFlight) {}

    /**
     * @param nextChunk Callable returning std::optional<Chunk>, std::nullopt ends the stream.
     * @param worker Callable turning a Chunk into a result, invoked concurrently.
     * @param sink Callable consuming the results in chunk order.
     * @return The number of processed chunks.
     */
    template <typename ChunkSource, typename ChunkWorker, typename ResultSink>
    auto run(ChunkSource &&nextChunk, ChunkWorker &&worker, ResultSink &&sink) const -> size_t {
        using Chunk = typename std::invoke_result_t<ChunkSource &>::value_type;
        using Result = std::invoke_result_t<ChunkWorker &, Chunk &&>;

        std::deque<std::future<Result>> chunksInFlight;
        size_t consumedChunks = 0;

        auto consumeOldest = [&]() {
            std::future<Result> oldest = std::move(chunksInFlight.front());
            chunksInFlight.pop_front();

            Result result = [&]() {
                try {
                    return oldest.get();
                } catch (const std::exception &e) {
                    throw std::runtime_error("Chunk " + std::to_string(consumedChunks) + ": " +
                                             e.what());
                }
            }();

            std::invoke(sink, std::move(result));
            ++consumedChunks;
        };

        while (auto chunk = std::invoke(nextChunk)) {
            if (chunksInFlight.size() >= maxChunksInFlight) {
                consumeOldest();
            }

            chunksInFlight.push_back(std::async(
                std::launch::async,
                [&worker](Chunk chunk) -> Result { return std::invoke(worker, std::move(chunk)); },
                std::move(chunk.value())));
        }

        while (!chunksInFlight.empty()) {
            consumeOldest();
        }

        return consumedChunks;
    }

    auto getMaxChunksInFlight() const -> size_t { return maxChunksInFlight; }

   private:
    const size_t maxChunksInFlight;
};

}  // namespace pipelines::tag
