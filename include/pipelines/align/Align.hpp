#pragma once

// Standard
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "CountData.hpp"
#include "CountParameters.hpp"

namespace pipelines {
namespace align {

namespace fs = std::filesystem;

/**
 * Aligns the genomic reads of every read pair with STAR into an unsorted BAM file that keeps the
 * input order and reports unique alignments only.
 */
class Align {
   public:
    explicit Align(CountParameters params) : parameters(std::move(params)) {};
    ~Align() = default;

    void process(const CountData &data) const;

    static auto starArguments(const CountSample &sample, const fs::path &genomeDir)
        -> std::vector<std::string>;

   private:
    CountParameters parameters;

    void alignSample(const CountSample &sample, const fs::path &starExecutable) const;

    auto resolveExecutable() const -> fs::path;
};

}  // namespace align
}  // namespace pipelines
