#pragma once
#include <memory>
#include <functional>

#include "RemoteChannel.h"
#include "../core/utils.h"

class Logger;

class ConnectionManager {
public:
    using ChannelFactory = std::function<std::unique_ptr<RemoteChannel>(const SessionConfig&, Logger&)>;

    ConnectionManager(const SessionConfig& config, Logger& logger);
    ConnectionManager(const SessionConfig& config, Logger& logger, ChannelFactory factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void connect();
    void close() noexcept;

    bool connected() const;
    RemoteChannel& channel();

private:
    const SessionConfig& cfg;
    Logger& log;
    ChannelFactory makeChannel;
    std::unique_ptr<RemoteChannel> current;
};

// Holds a connection for the length of one attempt.
class ScopedConnection {
public:
    explicit ScopedConnection(ConnectionManager& manager) : mgr(manager) {}
    ~ScopedConnection() { mgr.close(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

private:
    ConnectionManager& mgr;
};
