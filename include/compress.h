#ifndef COMPRESS_H
#define COMPRESS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

enum class CompressionLevel {
    Fast,
    Default,
    Best
};

// Maps a level to the integer zlib expects (1, 6, 9).
int zlibLevel(CompressionLevel level);
const char *levelName(CompressionLevel level);

// Unknown names map to Default.
CompressionLevel parseCompressionLevel(const std::string &name);

struct CompressionStats {
    std::uint64_t sourceSize = 0;
    std::uint64_t targetSize = 0;
    std::chrono::nanoseconds elapsed{0};
    double compressionRatio = 0.0;
};

class CompressionError : public std::runtime_error {
public:
    enum class Kind {
        InvalidInput,
        IoError
    };

    CompressionError(Kind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Called with the running count of source bytes consumed.
using ProgressCallback = std::function<void(std::uint64_t)>;

constexpr std::size_t kChunkSize = 1 << 20;

// Compresses source into a gzip file at target. An empty progress callback
// disables progress reporting; the output is identical either way.
// Throws CompressionError.
CompressionStats compressFile(const std::string &source, const std::string &target,
                              CompressionLevel level, const ProgressCallback &progress = {});

#endif
