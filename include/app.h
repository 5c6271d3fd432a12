#ifndef APP_H
#define APP_H

#include <ostream>
#include <string>
#include <vector>

// Runs one compression job from command-line arguments (program name
// excluded). Returns the process exit code: 0 on success, 1 on any error.
// The progress bar is drawn on err only when interactive is set.
int runApp(const std::vector<std::string> &args, std::ostream &out, std::ostream &err,
           bool useColor = false, bool interactive = false);

#endif
