#include <iostream>
#include <fstream>
#include <cstdlib>

#include "rl_logger.h"

// Function to log messages to both a log file and console
void logMessage(const std::string& message, std::ofstream& logFile) {
    std::cout << message << std::endl;
    if (logFile.is_open()) {
        logFile << message << std::endl;
    }
}

// Function to clear log file
void logClear(const std::string& logPath) {
    std::ofstream ofs(logPath, std::ofstream::trunc);
    ofs.close();
}

// Function to log errors, close the log file and terminate the program
[[noreturn]] void logErrorAndExit(const std::string& errorMessage, std::ofstream& logFile) {
    std::cerr << errorMessage;
    if (logFile.is_open()) {
        logFile << errorMessage;
        logFile.close();
    }

    std::exit(EXIT_FAILURE);
}
