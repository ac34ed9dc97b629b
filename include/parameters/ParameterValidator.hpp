#pragma once

// Standard
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <typeinfo>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"

namespace po = boost::program_options;

template <typename T>
concept arithmetic = std::integral<T> or std::floating_point<T>;

struct ParameterValidator {
    template <typename T>
        requires arithmetic<T>
    static auto validateArithmetic(const po::variables_map& params, const std::string& paramName,
                                   const T lowerLimit, const T upperLimit) -> T {
        Logger::log(LogLevel::DEBUG, "Validating ", paramName,
                    " parameter. Type: ", typeid(T).name(), ". Lower limit: ", lowerLimit,
                    ". Upper limit: ", upperLimit, ".");

        requireOption(params, paramName);

        T value;

        try {
            value = params[paramName].as<T>();
        } catch (const boost::bad_any_cast& e) {
            Logger::log(LogLevel::ERROR, paramName, " has an unexpected type. ",
                        std::string(e.what()));
            exit(EXIT_FAILURE);
        } catch (const po::error& e) {
            Logger::log(LogLevel::ERROR, "Unknown error occurred while parsing ", paramName, ". ",
                        std::string(e.what()));
            exit(EXIT_FAILURE);
        }

        if (value < lowerLimit || value > upperLimit) {
            Logger::log(LogLevel::ERROR, paramName + " must be a number between " +
                                             std::to_string(lowerLimit) + " and " +
                                             std::to_string(upperLimit));
        }

        return value;
    }

    static auto validateString(const po::variables_map& params, const std::string& paramName)
        -> std::string {
        requireOption(params, paramName);

        const std::string value = params[paramName].as<std::string>();
        if (value.empty()) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': must not be empty.");
        }

        return value;
    }

    static auto validateFilePath(const po::variables_map& params,
                                 const std::string& paramName) -> std::filesystem::path {
        std::filesystem::path filePath = std::filesystem::path(validateString(params, paramName));

        if (!std::filesystem::exists(filePath) || std::filesystem::is_directory(filePath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", filePath,
                        " is not a valid file path.");
        }

        return filePath;
    }

    static auto validateDirectory(const po::variables_map& params,
                                  const std::string& paramName) -> std::filesystem::path {
        std::filesystem::path dirPath = std::filesystem::path(validateString(params, paramName));

        if (!std::filesystem::is_directory(dirPath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", dirPath,
                        " is not a valid directory.");
        }

        return dirPath;
    }

    /**
     * Returns the output directory, creating it if it does not exist yet.
     */
    static auto validateOutputDirectory(const po::variables_map& params,
                                        const std::string& paramName) -> std::filesystem::path {
        std::filesystem::path dirPath = std::filesystem::path(validateString(params, paramName));

        std::error_code errorCode;
        std::filesystem::create_directories(dirPath, errorCode);
        if (errorCode || !std::filesystem::is_directory(dirPath)) {
            Logger::log(LogLevel::ERROR, "Check parameter '", paramName, "': ", dirPath,
                        " could not be created. ", errorCode.message());
        }

        return dirPath;
    }

   private:
    static void requireOption(const po::variables_map& params, const std::string& paramName) {
        if (params.count(paramName) == 0U) {
            Logger::log(LogLevel::ERROR, paramName, " is a required parameter.");
        }
    }
};
