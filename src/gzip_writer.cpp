#include "gzip_writer.h"
#include "compress.h"

#include <cerrno>
#include <cstring>
#include <limits>

static std::string systemError(const std::string &what, const std::string &path) {
    std::string cause = errno != 0 ? std::strerror(errno) : "unknown error";
    return what + " '" + path + "': " + cause;
}

GzipWriter::GzipWriter(const std::string &path, int level) : path_(path) {
    std::string mode = "wb" + std::to_string(level);
    errno = 0;
    file_ = gzopen(path.c_str(), mode.c_str());
    if (!file_) {
        throw CompressionError(CompressionError::Kind::IoError,
                               systemError("Failed to create compressed file", path_));
    }
}

GzipWriter::~GzipWriter() {
    if (file_) gzclose(file_);
}

void GzipWriter::write(const char *data, std::size_t length) {
    if (length == 0) return;
    if (!file_) {
        throw CompressionError(CompressionError::Kind::IoError,
                               "Write after close: " + path_);
    }
    if (length > std::numeric_limits<unsigned int>::max()) {
        throw CompressionError(CompressionError::Kind::IoError,
                               "Chunk too large for gzwrite: " + path_);
    }

    errno = 0;
    if (gzwrite(file_, data, static_cast<unsigned int>(length)) == 0) {
        int errnum = Z_OK;
        const char *msg = gzerror(file_, &errnum);
        if (errnum == Z_ERRNO) {
            throw CompressionError(CompressionError::Kind::IoError,
                                   systemError("Failed to write", path_));
        }
        throw CompressionError(CompressionError::Kind::IoError,
                               "Failed to write '" + path_ + "': " + msg);
    }
}

void GzipWriter::finish() {
    if (!file_) return;

    errno = 0;
    int rc = gzclose(file_);
    file_ = nullptr;
    if (rc == Z_ERRNO) {
        throw CompressionError(CompressionError::Kind::IoError,
                               systemError("Failed to finalize", path_));
    }
    if (rc != Z_OK) {
        throw CompressionError(CompressionError::Kind::IoError,
                               "Failed to finalize '" + path_ + "': " + zError(rc));
    }
}
