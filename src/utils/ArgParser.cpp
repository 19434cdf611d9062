#include "ArgParser.h"
#include <iostream>
#include <vector>

namespace {

const char* FORMATS_EPILOG =
    "Examples:\n"
    "  photo_dater /source/photos /dest/photos 1024 85\n"
    "  photo_dater ./input ./output 800 90\n"
    "\n"
    "Supported filename date formats:\n"
    "  - YYYY.MM.DD (e.g., 2023.12.25_photo.jpg)\n"
    "  - YYYY-MM-DD (e.g., 2023-12-25_photo.jpg)\n"
    "  - YYYY.MM or YYYY-MM (e.g., 2023.12_photo.jpg)\n"
    "  - YYYY (e.g., 2023_photo.jpg)\n";

const std::vector<std::string> POSITIONAL = {"source_path", "dest_path", "max_dimension", "quality"};

} // namespace

ArgParser::ArgParser()
    : m_options("photo_dater", "Process images with date information in filenames")
{
    m_options.positional_help("<source_path> <dest_path> <max_dimension> <quality>");
    m_options.add_options()
        ("source_path", "Source directory path", cxxopts::value<std::string>())
        ("dest_path", "Destination directory path", cxxopts::value<std::string>())
        ("max_dimension", "Maximum width/height in pixels", cxxopts::value<int>())
        ("quality", "JPEG quality (1-100)", cxxopts::value<int>())
        ("h,help", "Display this help menu");
    m_options.parse_positional(POSITIONAL);
}

std::string ArgParser::help() const {
    return m_options.help() + "\n" + FORMATS_EPILOG;
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << help() << std::endl;
            throw HelpRequested();
        }

        for (const auto& name : POSITIONAL) {
            if (!result.count(name)) {
                std::cerr << "Argument error: <" << name << "> is required" << std::endl;
                throw std::runtime_error("Missing required args.");
            }
        }

        Arguments args;
        args.sourcePath = result["source_path"].as<std::string>();
        args.destPath = result["dest_path"].as<std::string>();
        args.options.maxDimension = result["max_dimension"].as<int>();
        args.options.quality = result["quality"].as<int>();
        args.options.validate();
        return args;

    } catch (const cxxopts::OptionException& e) {
        std::cerr << "Error parsing arguments: " << e.what() << std::endl;
        throw std::runtime_error(std::string("Error parsing arguments: ") + e.what());
    }
}
