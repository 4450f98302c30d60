#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <libssh2.h>
#include "cli/ArgumentParser.h"
#include "core/RetryOrchestrator.h"
#include "net/ConnectionManager.h"
#include "io/TransferRecord.h"
#include "io/FileDistributor.h"
#include "monitor/Logger.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitExhausted = 2,
    ExitInterrupted = 3
};

struct SshLibrary {
    int status;
    SshLibrary() : status(libssh2_init(0)) {}
    ~SshLibrary() {
        if (status == 0)
            libssh2_exit();
    }
};

// wakes up every 200ms so a signal cuts the retry delay short
void interruptibleSleep(std::chrono::seconds delay) {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (gStopRequested == 0 && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
}
}

int main(int argc, char* argv[]) {
    SessionConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, config)) {
        std::cerr << "sdm: " << parser.error() << "\n\n";
        parser.printUsage();
        return ExitUsage;
    }

    Logger logger;
    logger.setMinLevel(config.verbose ? LogLevel::Debug : LogLevel::Info);
    if (!config.logFile.empty() && !logger.openFile(config.logFile))
        std::cerr << "sdm: cannot open log file " << config.logFile << ", logging to console only\n";
    logger.start();

    SshLibrary sshLibrary;
    if (sshLibrary.status != 0) {
        logger.error("libssh2 initialisation failed with code " + std::to_string(sshLibrary.status));
        logger.stop();
        return ExitExhausted;
    }

    RunOutcome outcome;
    {
        ConnectionManager connections(config, logger);
        TransferRecord record(config.recordPath);
        FileDistributor distributor(config.distributionDir);

        RetryOrchestrator orchestrator(config, connections, record, distributor, logger,
            interruptibleSleep, std::chrono::steady_clock::now, &gStopRequested);
        outcome = orchestrator.run();
    }

    int code = ExitOk;
    switch (outcome) {
    case RunOutcome::Transferred:
    case RunOutcome::NothingToDo:
        code = ExitOk;
        break;
    case RunOutcome::Exhausted:
        code = ExitExhausted;
        break;
    case RunOutcome::Cancelled:
        code = ExitInterrupted;
        break;
    }

    logger.stop();
    return code;
}
