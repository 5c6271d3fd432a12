#include "logger.h"
#include <fstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>

static std::mutex logMutex;

static std::string g_logFile = "log.txt";

void setLogFile(const std::string &path) {
    std::lock_guard<std::mutex> lock(logMutex);
    g_logFile = path;
}

std::string logFilePath() {
    std::lock_guard<std::mutex> lock(logMutex);
    return g_logFile;
}

void logMessage(const std::string &message) {
    std::lock_guard<std::mutex> lock(logMutex);

    std::ofstream logFile(g_logFile, std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "Failed to open log file: " << g_logFile << std::endl;
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string stamp = std::ctime(&now);
    // ctime terminates with '\n'
    if (!stamp.empty() && stamp.back() == '\n') stamp.pop_back();
    logFile << stamp << ": " << message << std::endl;
    logFile.close();
}
