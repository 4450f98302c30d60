#pragma once
#include <chrono>

#include "utils.h"
#include "../net/RemoteChannel.h"

class ConnectionWatchdog {
public:
    ConnectionWatchdog(std::chrono::seconds interval, Clock clock);

    bool isAlive(RemoteChannel& channel) noexcept;

    // probes only once the interval has elapsed since the last probe;
    // returns true when no probe was due
    bool check(RemoteChannel& channel);

    void reset();
    std::size_t probes() const { return probeCount; }

private:
    std::chrono::steady_clock::duration every;
    Clock now;
    std::chrono::steady_clock::time_point lastProbe;
    std::size_t probeCount = 0;
};
