#include "compress.h"
#include "gzip_writer.h"
#include "logger.h"
#include "stats.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

int zlibLevel(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::Fast:
            return Z_BEST_SPEED;
        case CompressionLevel::Best:
            return Z_BEST_COMPRESSION;
        case CompressionLevel::Default:
        default:
            return 6;
    }
}

const char *levelName(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::Fast:
            return "fast";
        case CompressionLevel::Best:
            return "best";
        case CompressionLevel::Default:
        default:
            return "default";
    }
}

CompressionLevel parseCompressionLevel(const std::string &name) {
    if (name == "fast") return CompressionLevel::Fast;
    if (name == "best") return CompressionLevel::Best;
    return CompressionLevel::Default;
}

static CompressionError ioError(const std::string &what, const std::string &path,
                                const std::error_code &ec) {
    return CompressionError(CompressionError::Kind::IoError,
                            what + " '" + path + "': " + ec.message());
}

static std::uint64_t checkedSourceSize(const std::string &source) {
    std::error_code ec;
    fs::file_status status = fs::status(source, ec);
    if (status.type() == fs::file_type::not_found) {
        throw CompressionError(CompressionError::Kind::InvalidInput,
                               "Source file '" + source + "' does not exist");
    }
    if (ec) throw ioError("Failed to stat", source, ec);
    if (!fs::is_regular_file(status)) {
        throw CompressionError(CompressionError::Kind::InvalidInput,
                               "Source '" + source + "' is not a regular file");
    }

    std::uint64_t size = fs::file_size(source, ec);
    if (ec) throw ioError("Failed to stat", source, ec);
    return size;
}

static void streamInto(std::ifstream &in, const std::string &source, GzipWriter &out,
                       const ProgressCallback &progress) {
    std::vector<char> buf(kChunkSize);
    std::uint64_t consumed = 0;
    for (;;) {
        errno = 0;
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        if (in.bad()) {
            std::string cause = errno != 0 ? std::strerror(errno) : "read error";
            throw CompressionError(CompressionError::Kind::IoError,
                                   "Failed to read '" + source + "': " + cause);
        }
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        out.write(buf.data(), static_cast<std::size_t>(got));
        consumed += static_cast<std::uint64_t>(got);
        if (progress) progress(consumed);
    }
}

CompressionStats compressFile(const std::string &source, const std::string &target,
                              CompressionLevel level, const ProgressCallback &progress) {
    try {
        std::uint64_t sourceSize = checkedSourceSize(source);

        errno = 0;
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open()) {
            std::string cause = errno != 0 ? std::strerror(errno) : "open failed";
            throw CompressionError(CompressionError::Kind::IoError,
                                   "Failed to open source '" + source + "': " + cause);
        }

        GzipWriter out(target, zlibLevel(level));
        logMessage("Compressing " + source + " -> " + target + " (level " +
                   levelName(level) + ", " + std::to_string(sourceSize) + " bytes)");

        auto start = std::chrono::steady_clock::now();
        streamInto(in, source, out, progress);
        out.finish();
        auto elapsed = std::chrono::steady_clock::now() - start;

        std::error_code ec;
        std::uint64_t targetSize = fs::file_size(target, ec);
        if (ec) throw ioError("Failed to stat", target, ec);

        CompressionStats stats;
        stats.sourceSize = sourceSize;
        stats.targetSize = targetSize;
        stats.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
        stats.compressionRatio = computeCompressionRatio(sourceSize, targetSize);

        logMessage("Compressed file: " + source + " -> " + target + " (" +
                   std::to_string(sourceSize) + " -> " + std::to_string(targetSize) + " bytes)");
        return stats;
    } catch (const CompressionError &ex) {
        logMessage(std::string("Compression failed: ") + ex.what());
        throw;
    }
}
