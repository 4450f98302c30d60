#include "ConnectionManager.h"
#include "SftpClient.h"
#include "../core/errors.h"
#include "../monitor/Logger.h"

namespace {
std::unique_ptr<RemoteChannel> makeSftpClient(const SessionConfig& config, Logger& logger) {
    return std::make_unique<SftpClient>(config, logger);
}
}

ConnectionManager::ConnectionManager(const SessionConfig& config, Logger& logger)
    : ConnectionManager(config, logger, makeSftpClient) {
}

ConnectionManager::ConnectionManager(const SessionConfig& config, Logger& logger, ChannelFactory factory)
    : cfg(config), log(logger), makeChannel(std::move(factory)) {
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::connect() {
    close();

    log.info("Connecting to " + cfg.host + ":" + std::to_string(cfg.port) + " as " + cfg.username);

    auto channel = makeChannel(cfg, log);
    if (!channel)
        throw ConnectionError("no channel available for " + cfg.host);

    if (!channel->open()) {
        std::string reason = channel->lastError();
        throw ConnectionError(reason.empty() ? "handshake with " + cfg.host + " failed" : reason);
    }

    current = std::move(channel);
    log.info("Connected, remote directory " + cfg.remoteDir);
}

// Safe on a never-opened or already closed connection. The caller has
// already given up on this channel, so release failures are only logged.
void ConnectionManager::close() noexcept {
    if (!current)
        return;

    try {
        current->close();
    }
    catch (const std::exception& e) {
        log.warning(std::string("Ignoring error while closing connection: ") + e.what());
    }
    current.reset();
}

bool ConnectionManager::connected() const {
    return current && current->isOpen();
}

RemoteChannel& ConnectionManager::channel() {
    if (!current)
        throw ConnectionError("not connected");
    return *current;
}
