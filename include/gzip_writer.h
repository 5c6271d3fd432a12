#ifndef GZIP_WRITER_H
#define GZIP_WRITER_H

#include <cstddef>
#include <string>
#include <zlib.h>

// Writes a single-member gzip file through zlib's gzFile API.
// finish() must be called for the trailer (CRC-32 and length) to reach
// the disk; the destructor closes an unfinished stream but cannot report
// errors. Failures throw CompressionError with Kind::IoError.
class GzipWriter {
public:
    GzipWriter(const std::string &path, int level);
    ~GzipWriter();

    GzipWriter(const GzipWriter &) = delete;
    GzipWriter &operator=(const GzipWriter &) = delete;

    void write(const char *data, std::size_t length);
    void finish();

private:
    std::string path_;
    gzFile file_ = nullptr;
};

#endif
