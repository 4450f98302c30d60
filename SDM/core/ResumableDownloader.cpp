#include "ResumableDownloader.h"
#include "ChunkedReader.h"
#include "errors.h"
#include "../io/FileWriter.h"
#include "../monitor/ProgressTracker.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::string megabytes(std::uint64_t bytes) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << bytes / 1024.0 / 1024.0 << "MB";
    return os.str();
}
}

ResumableDownloader::ResumableDownloader(RemoteChannel& channel,
    ConnectionWatchdog& dog,
    const SessionConfig& config,
    Logger& logger,
    Clock clock,
    volatile std::sig_atomic_t* externalStop)
    : remote(channel),
    watchdog(dog),
    cfg(config),
    log(logger),
    now(std::move(clock)),
    externalStopSignal(externalStop) {
}

bool ResumableDownloader::download(const std::string& remotePath, const std::string& localPath) {
    TransferState state;
    reached = 0;

    try {
        RemoteStat st;
        if (!remote.stat(remotePath, st))
            throw TransferError(remote.lastError().empty() ? "stat " + remotePath + " failed" : remote.lastError());
        state.totalSize = st.size;
        log.info("Target file size: " + megabytes(state.totalSize));

        std::error_code ec;
        if (fs::exists(localPath, ec))
            state.resumeOffset = fs::file_size(localPath, ec);
        if (ec)
            throw TransferError("cannot inspect " + localPath + ": " + ec.message());

        state.bytesTransferred = state.resumeOffset;
        reached = state.resumeOffset;

        // size-only check, a same-length corrupt file passes as complete
        if (state.resumeOffset >= state.totalSize) {
            if (state.resumeOffset > state.totalSize) {
                log.warning("Local file is larger than remote (" + std::to_string(state.resumeOffset) +
                    " > " + std::to_string(state.totalSize) + " bytes)");
            }
            if (!fs::exists(localPath, ec)) {
                std::ofstream touch(localPath, std::ios::binary);
                if (!touch.is_open())
                    throw TransferError("cannot create " + localPath);
            }
            log.info("File already complete");
            return true;
        }

        log.info("Resume point: " + std::to_string(state.resumeOffset) + " bytes (" + megabytes(state.resumeOffset) + ")");
        transfer(state, remotePath, localPath);
        return true;
    }
    catch (const CancelledError& e) {
        log.warning("Transfer interrupted at " + std::to_string(reached) + " bytes: " + e.what());
        throw;
    }
    catch (const SdmError& e) {
        log.error("Transfer failed at " + std::to_string(reached) + " bytes: " + e.what());
        throw;
    }
}

void ResumableDownloader::transfer(TransferState& state, const std::string& remotePath, const std::string& localPath) {
    FileWriter writer(localPath);
    if (!writer.open(state.resumeOffset > 0))
        throw TransferError("cannot open " + localPath + " for writing");

    ChunkedReader reader(remote, remotePath, state.resumeOffset, state.totalSize, cfg.chunkSize);

    const auto startTime = now();
    ProgressTracker progress(state.totalSize, state.resumeOffset, startTime);
    auto lastProgressLog = startTime;
    watchdog.reset();

    std::vector<char> chunk;
    while (true) {
        if (stopRequested())
            throw CancelledError("stop requested");

        if (!watchdog.check(remote)) {
            std::string reason = remote.lastError();
            throw TransferError("Connection watchdog triggered" + (reason.empty() ? "" : ": " + reason));
        }
        remote.keepAlive();

        if (!reader.next(chunk))
            break;

        // each chunk is on disk before the next one is requested
        if (!writer.write(chunk.data(), chunk.size()) || !writer.flush())
            throw TransferError("cannot write to " + localPath);

        state.bytesTransferred += chunk.size();
        reached = state.bytesTransferred;
        progress.add(chunk.size());

        auto t = now();
        if (t - lastProgressLog >= cfg.reportInterval) {
            log.info(progress.report(t));
            lastProgressLog = t;
        }
    }
    writer.close();

    const auto endTime = now();
    const std::chrono::duration<double> duration = endTime - startTime;
    {
        std::ostringstream conclusion;
        conclusion << "Stream ended after " << std::fixed << std::setprecision(2)
            << duration.count() << "s, " << progress.sessionBytes() << " bytes this session, avg speed "
            << std::setprecision(1) << progress.speedBytesPerSec(endTime) / 1024.0 << "KB/s";
        log.debug(conclusion.str());
    }

    std::error_code ec;
    std::uint64_t finalSize = fs::file_size(localPath, ec);
    if (ec)
        throw VerificationError("cannot stat " + localPath + ": " + ec.message());
    if (finalSize != state.totalSize) {
        throw VerificationError("Final size verification failed: local " + std::to_string(finalSize) +
            " bytes, remote " + std::to_string(state.totalSize) + " bytes");
    }

    log.info("Download fully verified");
}

bool ResumableDownloader::stopRequested() const {
    return externalStopSignal && *externalStopSignal != 0;
}
