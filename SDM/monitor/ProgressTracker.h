#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <string>

class ProgressTracker {
public:
    ProgressTracker(std::uint64_t totalBytes, std::uint64_t resumeOffset,
        std::chrono::steady_clock::time_point startedAt);

    void add(std::uint64_t bytes);
    std::uint64_t position() const;
    std::uint64_t sessionBytes() const;
    double progress() const;
    double speedBytesPerSec(std::chrono::steady_clock::time_point now) const;

    std::string report(std::chrono::steady_clock::time_point now) const;

private:
    std::uint64_t total;
    std::uint64_t offset;
    std::atomic<std::uint64_t> current{ 0 };
    std::chrono::steady_clock::time_point start;
};
