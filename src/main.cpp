//main.cpp
#include "app.h"

#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool useColor = isatty(STDOUT_FILENO) == 1;
    bool interactive = isatty(STDERR_FILENO) == 1;
    return runApp(args, std::cout, std::cerr, useColor, interactive);
}
