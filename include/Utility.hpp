#pragma once

// Standard
#include <concepts>
#include <filesystem>
#include <functional>
#include <ostream>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

// seqan3
#include <seqan3/alphabet/nucleotide/dna5.hpp>
#include <seqan3/alphabet/views/char_to.hpp>
#include <seqan3/alphabet/views/to_char.hpp>
#include <seqan3/utility/range/to.hpp>

// Internal
#include "Logger.hpp"

namespace helper {

template <typename Container>
concept StringContainer = std::ranges::range<Container> &&
                          std::same_as<std::ranges::range_value_t<Container>, std::string>;

namespace fs = std::filesystem;

void crashHandler(int sig);

void deleteDir(const fs::path &path);

inline auto hasSuffix(const std::string &fullString, const std::string &ending) -> bool {
    if (fullString.length() >= ending.length()) {
        return (0 ==
                fullString.compare(fullString.length() - ending.length(), ending.length(), ending));
    }
    return false;
};

template <StringContainer Container>
auto hasAnySuffix(const std::string &fullString, const Container &endings) -> bool {
    if (endings.empty()) {
        return true;
    }

    for (const auto &ending : endings) {
        if (hasSuffix(fullString, ending)) {
            return true;
        }
    }
    return false;
};

template <StringContainer Container = std::vector<std::string>>
auto getValidFilePaths(const fs::path &directory,
                       const Container &allowedSuffixes = Container{}) -> std::vector<fs::path> {
    std::vector<fs::path> filePaths;

    for (const auto &entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            Logger::log(LogLevel::WARNING, "Found not supported type in directory: ", entry.path());
            continue;
        }

        Logger::log(LogLevel::DEBUG, "Found file: ", entry.path());

        if (hasAnySuffix(entry.path().filename().string(), allowedSuffixes)) {
            filePaths.push_back(entry.path());
        }
    }

    std::ranges::sort(filePaths);

    return filePaths;
};

auto getUUID() -> std::string;

/**
 * Returns the part of a read identifier before the first whitespace.
 */
auto firstToken(std::string_view identifier) -> std::string_view;

template <std::ranges::input_range Sequence>
auto toString(Sequence &&sequence) -> std::string {
    return std::forward<Sequence>(sequence) | seqan3::views::to_char |
           seqan3::ranges::to<std::string>();
}

inline auto toDna5(const std::string &sequence) -> seqan3::dna5_vector {
    return sequence | seqan3::views::char_to<seqan3::dna5> |
           seqan3::ranges::to<seqan3::dna5_vector>();
}

/**
 * Opens a gzip compressed file and hands the compressing stream to writeContent.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
void writeGzip(const fs::path &path, const std::function<void(std::ostream &)> &writeContent);

/**
 * Writes one entry per line to a gzip compressed text file.
 */
void writeGzipLines(const fs::path &path, const std::vector<std::string> &lines);

/**
 * Temporary directory that is created on construction and removed with all its content when the
 * owner goes out of scope, also during stack unwinding.
 */
class ScopedTmpDir {
   public:
    explicit ScopedTmpDir(fs::path path);
    ScopedTmpDir(const ScopedTmpDir &) = delete;
    ScopedTmpDir(ScopedTmpDir &&) = delete;
    auto operator=(const ScopedTmpDir &) -> ScopedTmpDir & = delete;
    auto operator=(ScopedTmpDir &&) -> ScopedTmpDir & = delete;
    ~ScopedTmpDir();

    [[nodiscard]] auto path() const -> const fs::path & { return dirPath; }

    /** Returns a fresh, unique file path inside the directory. */
    [[nodiscard]] auto uniqueFilePath(const std::string &extension) const -> fs::path;

   private:
    fs::path dirPath;
};
}  // namespace helper
