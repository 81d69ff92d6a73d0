#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>

#include "rl_constants.h"

// Structure for storing program configuration options
struct ProgramOptions {
    std::filesystem::path configFile = DEFAULT_CONFIG_FILE;
    std::optional<std::filesystem::path> outputDir;
    std::optional<std::size_t> workers;
    bool silentMode = false;
};

// Function to parse command-line arguments
ProgramOptions parseArguments(int argc, char* argv[]);
