#include "options.h"

#include <sstream>

static bool takeValue(const std::vector<std::string> &args, std::size_t &i,
                      const std::string &flag, std::string &value, std::string &error) {
    if (i + 1 >= args.size()) {
        error = "Option " + flag + " requires a value";
        return false;
    }
    value = args[++i];
    return true;
}

static void applyLevel(ParseResult &result, const std::string &name) {
    result.job.level = parseCompressionLevel(name);
    if (name != "fast" && name != "default" && name != "best") {
        result.ignoredLevel = name;
    }
}

ParseResult parseArguments(const std::vector<std::string> &args) {
    ParseResult result;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        std::string value;

        if (arg == "-h" || arg == "--help") {
            result.action = ParseAction::Help;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            result.action = ParseAction::Version;
            return result;
        } else if (arg == "-q" || arg == "--quiet") {
            result.job.showProgress = false;
        } else if (arg == "-c" || arg == "--compression") {
            if (!takeValue(args, i, arg, value, result.error)) return result;
            applyLevel(result, value);
        } else if (arg.rfind("--compression=", 0) == 0) {
            applyLevel(result, arg.substr(std::string("--compression=").size()));
        } else if (arg == "-l" || arg == "--log-file") {
            if (!takeValue(args, i, arg, value, result.error)) return result;
            result.job.logFile = value;
        } else if (arg.rfind("--log-file=", 0) == 0) {
            result.job.logFile = arg.substr(std::string("--log-file=").size());
        } else if (arg.size() > 1 && arg[0] == '-') {
            result.error = "Unknown option: " + arg;
            return result;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        result.error = positional.empty() ? "Missing <source> and <target> arguments"
                                          : "Missing <target> argument";
        return result;
    }
    if (positional.size() > 2) {
        result.error = "Unexpected argument: " + positional[2];
        return result;
    }

    result.job.source = positional[0];
    result.job.target = positional[1];
    result.action = ParseAction::Run;
    return result;
}

std::string usageText(const std::string &program) {
    std::ostringstream out;
    out << "File Compressor " << FILECOMPRESSOR_VERSION << "\n";
    out << "Compresses files using GZIP compression\n\n";
    out << "Usage:\n";
    out << "  " << program << " [options] <source> <target>\n\n";
    out << "Options:\n";
    out << "  -c, --compression <level>  Compression level (fast, default, best) [default: default]\n";
    out << "  -q, --quiet                Disable progress bar\n";
    out << "  -l, --log-file <path>      Log file [default: log.txt]\n";
    out << "  -h, --help                 Show this help\n";
    out << "  -V, --version              Show version\n";
    return out.str();
}
