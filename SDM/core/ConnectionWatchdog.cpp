#include "ConnectionWatchdog.h"
#include <exception>

ConnectionWatchdog::ConnectionWatchdog(std::chrono::seconds interval, Clock clock)
    : every(interval), now(std::move(clock)) {
    reset();
}

bool ConnectionWatchdog::isAlive(RemoteChannel& channel) noexcept {
    ++probeCount;
    try {
        return channel.isOpen() && channel.probe();
    }
    catch (const std::exception&) {
        // a probe that blows up is a dead connection
        return false;
    }
}

bool ConnectionWatchdog::check(RemoteChannel& channel) {
    auto t = now();
    if (t - lastProbe < every)
        return true;

    lastProbe = t;
    return isAlive(channel);
}

void ConnectionWatchdog::reset() {
    lastProbe = now();
}
