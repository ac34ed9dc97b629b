#pragma once

// Standard
#include <array>
#include <filesystem>
#include <string>

// Internal
#include "Utility.hpp"

namespace pipelines {

namespace fs = std::filesystem;

static const std::array<std::string, 4> validInputSuffixes{".fastq", ".fastq.gz", ".fq", ".fq.gz"};

struct PipelineData {
   protected:
    static auto isHidden(const std::filesystem::path &path) -> bool {
        std::string filename = path.filename().string();
        return !filename.empty() && filename[0] == '.';
    }

    /**
     * File name without its FASTQ suffix (including the compression suffix).
     */
    static auto getFastqStem(const fs::path &filePath) -> std::string {
        const std::string fileName = filePath.filename().string();
        for (const auto &suffix : validInputSuffixes) {
            if (suffix.ends_with(".gz") && helper::hasSuffix(fileName, suffix)) {
                return fileName.substr(0, fileName.size() - suffix.size());
            }
        }
        for (const auto &suffix : validInputSuffixes) {
            if (helper::hasSuffix(fileName, suffix)) {
                return fileName.substr(0, fileName.size() - suffix.size());
            }
        }
        return filePath.stem().string();
    }
};
}  // namespace pipelines
