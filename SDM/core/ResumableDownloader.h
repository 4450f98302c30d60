#pragma once
#include <string>
#include <cstdint>
#include <csignal>

#include "utils.h"
#include "ConnectionWatchdog.h"
#include "../net/RemoteChannel.h"
#include "../monitor/Logger.h"

class ResumableDownloader {
public:
    ResumableDownloader(RemoteChannel& channel,
        ConnectionWatchdog& watchdog,
        const SessionConfig& config,
        Logger& logger,
        Clock clock,
        volatile std::sig_atomic_t* externalStop = nullptr);

    // Throws TransferError, VerificationError or CancelledError.
    bool download(const std::string& remotePath, const std::string& localPath);

    // byte offset the local file had reached when download() last returned
    std::uint64_t reachedOffset() const { return reached; }

private:
    bool stopRequested() const;
    void transfer(TransferState& state, const std::string& remotePath, const std::string& localPath);

private:
    RemoteChannel& remote;
    ConnectionWatchdog& watchdog;
    const SessionConfig& cfg;
    Logger& log;
    Clock now;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };
    std::uint64_t reached = 0;
};
