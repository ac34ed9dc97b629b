#include "Utility.hpp"

// Standard
#include <execinfo.h>
#include <unistd.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <system_error>

// Boost
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace helper {

void crashHandler(int sig) {
    constexpr size_t MAX_FRAMES = 10;
    std::array<void *, MAX_FRAMES> array{};
    int size = backtrace(array.data(), MAX_FRAMES);

    std::cerr << "Error: signal " << sig << ":" << '\n';
    backtrace_symbols_fd(array.data(), size, STDERR_FILENO);
    exit(1);
}

void deleteDir(const fs::path &path) {
    if (fs::exists(path)) {
        fs::remove_all(path);
    }
}

auto getUUID() -> std::string {
    boost::uuids::random_generator uuidGenerator;
    return boost::uuids::to_string(uuidGenerator());
}

auto firstToken(std::string_view identifier) -> std::string_view {
    const size_t end = identifier.find_first_of(" \t");
    return end == std::string_view::npos ? identifier : identifier.substr(0, end);
}

void writeGzip(const fs::path &path, const std::function<void(std::ostream &)> &writeContent) {
    namespace io = boost::iostreams;

    io::file_sink sink(path.string(), std::ios_base::out | std::ios_base::binary);
    if (!sink.is_open()) {
        throw std::runtime_error("Could not open output file: " + path.string());
    }

    io::filtering_ostream out;
    out.push(io::gzip_compressor());
    out.push(sink);

    writeContent(out);

    out.reset();
}

void writeGzipLines(const fs::path &path, const std::vector<std::string> &lines) {
    writeGzip(path, [&lines](std::ostream &out) {
        for (const auto &line : lines) {
            out << line << '\n';
        }
    });
}

ScopedTmpDir::ScopedTmpDir(fs::path path) : dirPath(std::move(path)) {
    deleteDir(dirPath);
    fs::create_directories(dirPath);
    Logger::log(LogLevel::DEBUG, "Created temporary directory ", dirPath);
}

ScopedTmpDir::~ScopedTmpDir() {
    std::error_code errorCode;
    fs::remove_all(dirPath, errorCode);
    if (errorCode) {
        Logger::log(LogLevel::WARNING, "Could not remove temporary directory ", dirPath, ": ",
                    errorCode.message());
    }
}

auto ScopedTmpDir::uniqueFilePath(const std::string &extension) const -> fs::path {
    return dirPath / (getUUID() + extension);
}

}  // namespace helper
