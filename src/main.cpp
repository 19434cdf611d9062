#include "core/BatchProcessor.h"
#include "utils/ArgParser.h"

#include <iostream>

int main(int argc, char** argv) {
    ArgParser::Arguments args;
    try {
        ArgParser parser;
        args = parser.parseArgs(argc, argv);
    } catch (const ArgParser::HelpRequested&) {
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        PhotoDater::BatchProcessor processor(args.options);
        processor.processDirectory(args.sourcePath, args.destPath);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
