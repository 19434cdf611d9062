#ifndef ARG_PARSER_H
#define ARG_PARSER_H

#include <stdexcept>
#include <string>
#include "cxxopts.hpp" // Requires cxxopts dependency
#include "../core/ImageNormalizer.h"

/**
 * @brief Utility class to parse the photo_dater command line using cxxopts.
 *
 * Usage: photo_dater <source_path> <dest_path> <max_dimension> <quality>
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string sourcePath;
        std::string destPath;
        PhotoDater::ProcessorOptions options;
    };

    /**
     * @brief Thrown after the help text has been printed.
     */
    class HelpRequested : public std::runtime_error {
    public:
        HelpRequested() : std::runtime_error("Help displayed.") {}
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed, validated values.
     * @throws HelpRequested if -h/--help was given.
     * @throws std::runtime_error for missing, malformed or out-of-range arguments.
     */
    Arguments parseArgs(int argc, char** argv);

    /**
     * @brief The help text, including the supported filename date formats.
     */
    std::string help() const;

private:
    cxxopts::Options m_options;
};

#endif // ARG_PARSER_H
