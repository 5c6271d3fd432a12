#ifndef LOGGER_H
#define LOGGER_H

#include <string>

// Selects the file logMessage appends to. Defaults to "log.txt".
void setLogFile(const std::string &path);
std::string logFilePath();

void logMessage(const std::string &message);

#endif
