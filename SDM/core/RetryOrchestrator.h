#pragma once
#include <string>
#include <vector>
#include <optional>
#include <csignal>
#include <chrono>

#include "utils.h"
#include "../net/ConnectionManager.h"
#include "../io/TransferRecord.h"
#include "../io/FileDistributor.h"
#include "../monitor/Logger.h"

class RetryOrchestrator {
public:
    enum class State {
        Idle,
        Connecting,
        Selecting,
        Transferring,
        Recording,
        Succeeded,
        AttemptFailed,
        Exhausted
    };

    RetryOrchestrator(const SessionConfig& config,
        ConnectionManager& connections,
        TransferRecord& record,
        FileDistributor& distributor,
        Logger& logger,
        Sleeper sleeper,
        Clock clock,
        volatile std::sig_atomic_t* externalStop = nullptr);

    RunOutcome run();

    State state() const { return current; }
    const std::vector<State>& history() const { return transitions; }
    const std::string& lastError() const { return lastErr; }
    const std::string& transferredFile() const { return selectedName; }
    std::size_t attemptsMade() const { return attempts; }

    std::chrono::seconds delayFor(std::size_t attempt) const;

private:
    enum class AttemptResult {
        Transferred,
        NothingToDo
    };

    AttemptResult runAttempt();
    void recordCompletion(const std::string& fileName);
    void distribute(const std::string& localPath, const std::string& fileName);
    void setState(State next);
    bool stopRequested() const;

private:
    const SessionConfig& cfg;
    ConnectionManager& connections;
    TransferRecord& transferRecord;
    FileDistributor& distributor;
    Logger& log;
    Sleeper sleep;
    Clock now;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    std::optional<std::string> lastRecorded;
    std::string selectedName;
    std::string lastErr;
    std::uint64_t offsetReached = 0;
    std::size_t attempts = 0;
    State current = State::Idle;
    std::vector<State> transitions;
};

const char* toString(RetryOrchestrator::State state);
