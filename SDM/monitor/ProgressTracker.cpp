#include "ProgressTracker.h"
#include <iomanip>
#include <sstream>

ProgressTracker::ProgressTracker(std::uint64_t totalBytes, std::uint64_t resumeOffset,
    std::chrono::steady_clock::time_point startedAt)
    : total(totalBytes),
    offset(resumeOffset),
    start(startedAt) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::position() const {
    return offset + sessionBytes();
}

std::uint64_t ProgressTracker::sessionBytes() const {
    return current.load(std::memory_order_relaxed);
}

double ProgressTracker::progress() const {
    return total == 0 ? 1.0 : (double)position() / (double)total;
}

// resumed bytes are excluded so a resume does not report a burst of speed
double ProgressTracker::speedBytesPerSec(std::chrono::steady_clock::time_point now) const {
    std::chrono::duration<double> elapsed = now - start;
    return elapsed.count() > 0 ? sessionBytes() / elapsed.count() : 0.0;
}

std::string ProgressTracker::report(std::chrono::steady_clock::time_point now) const {
    std::ostringstream os;
    os << "Progress: " << std::fixed << std::setprecision(1) << progress() * 100.0 << "%"
        << " | Speed: " << std::setprecision(1) << speedBytesPerSec(now) / 1024.0 << "KB/s"
        << " | Position: " << std::setprecision(2) << position() / 1024.0 / 1024.0 << "MB";
    return os.str();
}
