#include "RetryOrchestrator.h"
#include "FileSelector.h"
#include "ConnectionWatchdog.h"
#include "ResumableDownloader.h"
#include "errors.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

const char* toString(RetryOrchestrator::State state) {
    switch (state) {
    case RetryOrchestrator::State::Idle: return "Idle";
    case RetryOrchestrator::State::Connecting: return "Connecting";
    case RetryOrchestrator::State::Selecting: return "Selecting";
    case RetryOrchestrator::State::Transferring: return "Transferring";
    case RetryOrchestrator::State::Recording: return "Recording";
    case RetryOrchestrator::State::Succeeded: return "Succeeded";
    case RetryOrchestrator::State::AttemptFailed: return "AttemptFailed";
    case RetryOrchestrator::State::Exhausted: return "Exhausted";
    }
    return "Unknown";
}

RetryOrchestrator::RetryOrchestrator(const SessionConfig& config,
    ConnectionManager& connectionManager,
    TransferRecord& record,
    FileDistributor& fileDistributor,
    Logger& logger,
    Sleeper sleeper,
    Clock clock,
    volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    connections(connectionManager),
    transferRecord(record),
    distributor(fileDistributor),
    log(logger),
    sleep(std::move(sleeper)),
    now(std::move(clock)),
    externalStopSignal(externalStop) {
}

RunOutcome RetryOrchestrator::run() {
    log.info("=== SFTP DOWNLOAD MANAGER ===");

    // read once per run, before any selection
    lastRecorded = transferRecord.load();
    if (lastRecorded)
        log.info("Last completed file: " + *lastRecorded);
    else
        log.info("No transfer record, starting from the earliest file");

    const std::size_t maxAttempts = cfg.maxAttempts == 0 ? 1 : cfg.maxAttempts;

    for (std::size_t attempt = 1; attempt <= maxAttempts; ++attempt) {
        attempts = attempt;
        if (stopRequested()) {
            lastErr = "stop requested";
            log.warning("Run cancelled before attempt " + std::to_string(attempt));
            return RunOutcome::Cancelled;
        }

        log.info("Attempt " + std::to_string(attempt) + " of " + std::to_string(maxAttempts));
        offsetReached = 0;

        try {
            AttemptResult result = runAttempt();
            setState(State::Succeeded);
            return result == AttemptResult::Transferred ? RunOutcome::Transferred : RunOutcome::NothingToDo;
        }
        catch (const CancelledError& e) {
            lastErr = e.what();
            log.warning("Run cancelled: " + lastErr);
            return RunOutcome::Cancelled;
        }
        catch (const std::exception& e) {
            lastErr = e.what();
            setState(State::AttemptFailed);
            log.error("Attempt " + std::to_string(attempt) + " failed at offset " +
                std::to_string(offsetReached) + ": " + lastErr);
        }

        if (attempt < maxAttempts) {
            auto delay = delayFor(attempt);
            log.info("Countermeasure: Retrying in " + std::to_string(delay.count()) + " seconds...");
            sleep(delay);
        }
    }

    setState(State::Exhausted);
    log.error("OPERATION FAILED: " + lastErr);
    return RunOutcome::Exhausted;
}

std::chrono::seconds RetryOrchestrator::delayFor(std::size_t attempt) const {
    if (cfg.backoff.empty() || attempt == 0)
        return std::chrono::seconds(0);

    std::size_t index = std::min(attempt, cfg.backoff.size()) - 1;
    return cfg.backoff[index];
}

RetryOrchestrator::AttemptResult RetryOrchestrator::runAttempt() {
    // released on every exit path, before the retry sleep
    ScopedConnection scope(connections);

    setState(State::Connecting);
    connections.connect();
    RemoteChannel& channel = connections.channel();

    setState(State::Selecting);
    FileSelector selector(channel, cfg.remoteDir, cfg.fileMarker);
    auto candidates = selector.listCandidates();
    if (candidates.empty()) {
        log.warning("No matching files found in " + cfg.remoteDir);
        return AttemptResult::NothingToDo;
    }

    auto selected = FileSelector::select(candidates, lastRecorded);
    if (!selected) {
        log.info("No new files to download after " + lastRecorded.value_or("<none>"));
        return AttemptResult::NothingToDo;
    }
    selectedName = selected->name;
    log.info("Selected " + selectedName + " (date " + selected->dateToken + ")");

    setState(State::Transferring);
    std::error_code ec;
    fs::create_directories(cfg.localDir, ec);
    if (ec)
        throw TransferError("cannot create " + cfg.localDir + ": " + ec.message());

    const std::string remotePath = joinRemotePath(cfg.remoteDir, selectedName);
    const std::string localPath = (fs::path(cfg.localDir) / selectedName).string();

    ConnectionWatchdog watchdog(cfg.probeInterval, now);
    ResumableDownloader downloader(channel, watchdog, cfg, log, now, externalStopSignal);
    try {
        downloader.download(remotePath, localPath);
    }
    catch (const SdmError&) {
        offsetReached = downloader.reachedOffset();
        throw;
    }
    offsetReached = downloader.reachedOffset();

    // the artifact is complete on disk; nothing below may fail the run
    setState(State::Recording);
    try {
        recordCompletion(selectedName);
    }
    catch (const RecordingError& e) {
        log.error(e.what());
    }

    log.info("Mission accomplished");

    try {
        distribute(localPath, selectedName);
    }
    catch (const RecordingError& e) {
        log.error(e.what());
    }

    return AttemptResult::Transferred;
}

void RetryOrchestrator::recordCompletion(const std::string& fileName) {
    if (!transferRecord.save(fileName))
        throw RecordingError("Failed to update transfer record: " + transferRecord.lastError());
    log.debug("Transfer record now " + fileName);
}

void RetryOrchestrator::distribute(const std::string& localPath, const std::string& fileName) {
    if (!distributor.enabled())
        return;

    if (!distributor.place(localPath, fileName))
        throw RecordingError("Failed to sync to server directory: " + distributor.lastError());
    log.info("Synced " + fileName + " to server directory " + distributor.directory());
}

void RetryOrchestrator::setState(State next) {
    current = next;
    transitions.push_back(next);
    log.debug(std::string("State -> ") + toString(next));
}

bool RetryOrchestrator::stopRequested() const {
    return externalStopSignal && *externalStopSignal != 0;
}
