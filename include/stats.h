#ifndef STATS_H
#define STATS_H

#include "compress.h"

#include <chrono>
#include <cstdint>
#include <string>

constexpr double kBytesPerMegabyte = 1048576.0;

// 1 - target/source, or 0.0 for an empty source. Negative when the
// output grew.
double computeCompressionRatio(std::uint64_t sourceSize, std::uint64_t targetSize);

double toMegabytes(std::uint64_t bytes);

// "512.00ns", "3.25ms", "1.50s" etc.
std::string formatElapsed(std::chrono::nanoseconds elapsed);

std::string formatStats(const CompressionStats &stats);

#endif
