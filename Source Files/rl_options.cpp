#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#include "rl_options.h"

namespace {

    // Value following an option, or exit with usage error
    std::string optionValue(int argc, char* argv[], int& i, const std::string& option) {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for option " << option << "\n";
            std::exit(EXIT_FAILURE);
        }
        return argv[++i];
    }

}

// Function to parse command-line arguments
ProgramOptions parseArguments(int argc, char* argv[]) {
    ProgramOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string argLower = arg;
        std::transform(argLower.begin(), argLower.end(), argLower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (argLower == "--config" || argLower == "-c") {
            options.configFile = optionValue(argc, argv, i, arg);
        }
        else if (argLower == "--output" || argLower == "-o") {
            options.outputDir = optionValue(argc, argv, i, arg);
        }
        else if (argLower == "--workers" || argLower == "-w") {
            const std::string value = optionValue(argc, argv, i, arg);
            const long workers = std::strtol(value.c_str(), nullptr, 10);
            if (workers <= 0) {
                std::cerr << "Invalid worker count: " << value << "\n";
                std::exit(EXIT_FAILURE);
            }
            options.workers = static_cast<std::size_t>(workers);
        }
        else if (argLower == "--silent" || argLower == "-s") {
            options.silentMode = true;
        }
        else if (argLower == "--help" || argLower == "-h") {
            std::cout << "=============================\n"
                << "Record Linkage Matcher - Help\n"
                << "=============================\n\n"
                << "Usage:\n"
                << "  rl_matcher [OPTIONS]\n\n"
                << "Options:\n"
                << "  -c, --config FILE   Match configuration (default: config.json)\n"
                << "  -o, --output DIR    Directory for match shards (overrides output_dir)\n"
                << "  -w, --workers N     Worker threads (overrides num_processes)\n"
                << "  -s, --silent        Suppress non-critical messages\n"
                << "  -h, --help          Show this help message\n\n"
                << "Without 'database_information' in the configuration the matcher blocks\n"
                << "in memory and keeps candidate sets as CSV files in the output directory.\n";

            std::exit(EXIT_SUCCESS);
        }
        else {
            std::cerr << "Unknown option: " << arg << " (see --help)\n";
            std::exit(EXIT_FAILURE);
        }
    }

    return options;
}
