#ifndef OPTIONS_H
#define OPTIONS_H

#include "compress.h"

#include <string>
#include <vector>

#define FILECOMPRESSOR_VERSION "2.0"

struct CompressionJob {
    std::string source;
    std::string target;
    CompressionLevel level = CompressionLevel::Default;
    bool showProgress = true;
    std::string logFile = "log.txt";
};

enum class ParseAction {
    Run,
    Help,
    Version,
    Error
};

struct ParseResult {
    ParseAction action = ParseAction::Error;
    CompressionJob job;
    std::string error;
    // Set when --compression named an unknown level and Default was used.
    std::string ignoredLevel;
};

// args excludes the program name.
ParseResult parseArguments(const std::vector<std::string> &args);

std::string usageText(const std::string &program);

#endif
