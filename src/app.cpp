#include "app.h"
#include "compress.h"
#include "logger.h"
#include "options.h"
#include "progress.h"
#include "stats.h"

#include <exception>
#include <filesystem>
#include <memory>
#include <sstream>

static const char *kGreen = "\033[1;92m";
static const char *kBlue = "\033[1;94m";
static const char *kYellow = "\033[93m";
static const char *kRed = "\033[1;91m";
static const char *kReset = "\033[0m";

static std::string paint(const std::string &text, const char *color, bool useColor) {
    if (!useColor) return text;
    return std::string(color) + text + kReset;
}

// Colors the "Label:" part of each summary line.
static std::string paintSummary(const std::string &summary, bool useColor) {
    if (!useColor) return summary;
    std::istringstream in(summary);
    std::ostringstream out;
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            out << line << '\n';
            continue;
        }
        out << paint(line.substr(0, colon), kYellow, true) << line.substr(colon) << '\n';
    }
    return out.str();
}

int runApp(const std::vector<std::string> &args, std::ostream &out, std::ostream &err,
           bool useColor, bool interactive) {
    ParseResult parsed = parseArguments(args);
    switch (parsed.action) {
        case ParseAction::Help:
            out << usageText("FileCompressor");
            return 0;
        case ParseAction::Version:
            out << "FileCompressor " << FILECOMPRESSOR_VERSION << std::endl;
            return 0;
        case ParseAction::Error:
            err << paint("Error:", kRed, useColor) << " " << parsed.error << "\n\n"
                << usageText("FileCompressor");
            return 1;
        case ParseAction::Run:
            break;
    }

    const CompressionJob &job = parsed.job;
    setLogFile(job.logFile);
    if (!parsed.ignoredLevel.empty()) {
        logMessage("Unknown compression level '" + parsed.ignoredLevel + "', using default");
    }

    out << "\n" << paint("File Compression Utility", kGreen, useColor) << "\n";
    out << paint("=======================", kGreen, useColor) << std::endl;

    try {
        std::unique_ptr<ConsoleProgressBar> bar;
        ProgressCallback progress;
        if (job.showProgress && interactive) {
            std::error_code ec;
            std::uintmax_t total = std::filesystem::file_size(job.source, ec);
            bar = std::make_unique<ConsoleProgressBar>(ec ? 0 : total, err);
            ConsoleProgressBar *raw = bar.get();
            progress = [raw](std::uint64_t consumed) { raw->update(consumed); };
        }

        CompressionStats stats = compressFile(job.source, job.target, job.level, progress);
        if (bar) bar->finish("Compression complete");

        out << "\n" << paint("Compression Summary:", kBlue, useColor) << "\n";
        out << paintSummary(formatStats(stats), useColor);
        out << "\n" << paint("Compression completed successfully!", kGreen, useColor) << "\n" << std::endl;
        return 0;
    } catch (const CompressionError &ex) {
        err << "\n" << paint("Error:", kRed, useColor) << " ";
        if (ex.kind() == CompressionError::Kind::IoError) err << "IO error: ";
        err << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        logMessage(std::string("Compression failed: ") + ex.what());
        err << "\n" << paint("Error:", kRed, useColor) << " " << ex.what() << std::endl;
        return 1;
    }
}
