#include "progress.h"
#include "stats.h"

#include <algorithm>
#include <cstdio>

static const auto kRedrawInterval = std::chrono::milliseconds(100);

ConsoleProgressBar::ConsoleProgressBar(std::uint64_t total, std::ostream &out)
    : total_(total), out_(out), start_(std::chrono::steady_clock::now()), lastDraw_(start_) {}

static std::string clockString(long long seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  seconds / 3600, (seconds / 60) % 60, seconds % 60);
    return buf;
}

std::string ConsoleProgressBar::renderLine(std::uint64_t position,
                                           std::chrono::steady_clock::duration elapsed) const {
    position = std::min(position, total_);
    int filled = total_ == 0 ? kWidth : static_cast<int>(position * kWidth / total_);

    std::string bar(static_cast<std::size_t>(filled), '#');
    if (filled < kWidth) {
        bar += '>';
        bar.append(static_cast<std::size_t>(kWidth - filled - 1), '-');
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    std::string eta = "?";
    if (position > 0) {
        double perByte = std::chrono::duration<double>(elapsed).count() / static_cast<double>(position);
        eta = std::to_string(static_cast<long long>(perByte * static_cast<double>(total_ - position))) + "s";
    }

    char sizes[64];
    std::snprintf(sizes, sizeof(sizes), "%.2f MiB/%.2f MiB", toMegabytes(position), toMegabytes(total_));

    return "[" + clockString(seconds) + "] [" + bar + "] " + sizes + " (eta " + eta + ")";
}

void ConsoleProgressBar::draw(std::uint64_t position) {
    auto now = std::chrono::steady_clock::now();
    out_ << '\r' << renderLine(position, now - start_) << std::flush;
    lastDraw_ = now;
    drawn_ = true;
}

void ConsoleProgressBar::update(std::uint64_t position) {
    if (finished_) return;
    auto now = std::chrono::steady_clock::now();
    if (drawn_ && position < total_ && now - lastDraw_ < kRedrawInterval) return;
    draw(position);
}

void ConsoleProgressBar::finish(const std::string &message) {
    if (finished_) return;
    draw(total_);
    out_ << '\n' << message << std::endl;
    finished_ = true;
}
