#ifndef PROGRESS_H
#define PROGRESS_H

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

// Single-line terminal progress bar, redrawn in place with '\r'.
class ConsoleProgressBar {
public:
    ConsoleProgressBar(std::uint64_t total, std::ostream &out);

    void update(std::uint64_t position);
    void finish(const std::string &message);

    // "[00:00:03] [#####>----...] 3.00 MiB/10.00 MiB (eta 7s)"
    std::string renderLine(std::uint64_t position, std::chrono::steady_clock::duration elapsed) const;

    static constexpr int kWidth = 40;

private:
    void draw(std::uint64_t position);

    std::uint64_t total_;
    std::ostream &out_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point lastDraw_;
    bool drawn_ = false;
    bool finished_ = false;
};

#endif
