#include "stats.h"

#include <cstdio>
#include <sstream>

double computeCompressionRatio(std::uint64_t sourceSize, std::uint64_t targetSize) {
    if (sourceSize == 0) return 0.0;
    return 1.0 - static_cast<double>(targetSize) / static_cast<double>(sourceSize);
}

double toMegabytes(std::uint64_t bytes) {
    return static_cast<double>(bytes) / kBytesPerMegabyte;
}

static std::string fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

std::string formatElapsed(std::chrono::nanoseconds elapsed) {
    double ns = static_cast<double>(elapsed.count());
    if (ns < 1e3) return fixed(ns, 2) + "ns";
    if (ns < 1e6) return fixed(ns / 1e3, 2) + "us";
    if (ns < 1e9) return fixed(ns / 1e6, 2) + "ms";
    return fixed(ns / 1e9, 2) + "s";
}

std::string formatStats(const CompressionStats &stats) {
    std::ostringstream out;
    out << "Source file size: " << fixed(toMegabytes(stats.sourceSize), 2) << " MB\n";
    out << "Compressed size: " << fixed(toMegabytes(stats.targetSize), 2) << " MB\n";
    out << "Compression ratio: " << fixed(stats.compressionRatio * 100.0, 1) << "%\n";
    out << "Time elapsed: " << formatElapsed(stats.elapsed) << "\n";
    return out.str();
}
