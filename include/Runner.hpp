#pragma once

// Internal
#include "CountData.hpp"
#include "CountParameters.hpp"
#include "ParseParameters.hpp"

using namespace pipelines;

class Runner {
   public:
    Runner() = delete;
    Runner(const Runner&) = delete;
    Runner(Runner&&) = delete;
    auto operator=(const Runner&) -> Runner& = delete;
    auto operator=(Runner&&) -> Runner& = delete;
    ~Runner() = delete;

    static void runPipeline(int argc, const char* const argv[]);

   private:
    struct Pipeline {
        void operator()(const CountParameters& params);
        void operator()(const ParseParameters& params);
    };

    static void runCountPipeline(const CountParameters& parameters);
    static void runParsePipeline(const ParseParameters& parameters);

    static void runTagAndSortStages(const CountParameters& parameters, const CountData& data);
};
