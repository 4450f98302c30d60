#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <functional>

using Clock = std::function<std::chrono::steady_clock::time_point()>;
using Sleeper = std::function<void(std::chrono::seconds)>;

struct TcpKeepalive {
    long idleSeconds = 20;
    long intervalSeconds = 5;
    long probeCount = 3;
};

struct SessionConfig {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;
    std::string knownHostsFile;

    std::string remoteDir;
    std::string fileMarker = "IPI";
    std::string localDir;
    std::string distributionDir;
    std::string recordPath;
    std::string logFile;
    bool verbose = false;

    std::size_t chunkSize = 2 * 1024 * 1024;
    std::size_t maxAttempts = 7;
    std::vector<std::chrono::seconds> backoff{
        std::chrono::seconds(5), std::chrono::seconds(10), std::chrono::seconds(30),
        std::chrono::seconds(60), std::chrono::seconds(120), std::chrono::seconds(300),
        std::chrono::seconds(600) };

    // connection hardening
    std::uint64_t windowSize = 16 * 1024 * 1024;
    std::uint64_t rekeyBytes = 512ULL * 1024 * 1024;
    bool compression = true;
    std::chrono::seconds keepaliveInterval{ 15 };
    TcpKeepalive tcpKeepalive;
    std::chrono::seconds connectTimeout{ 30 };
    std::chrono::seconds stallTimeout{ 120 };

    // sampling cadence
    std::chrono::seconds probeInterval{ 10 };
    std::chrono::seconds reportInterval{ 30 };
};

struct RemoteFileDescriptor {
    std::string name;
    std::string dateToken;
};

struct TransferState {
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalSize = 0;
    std::uint64_t resumeOffset = 0;
};

enum class RunOutcome {
    Transferred,
    NothingToDo,
    Exhausted,
    Cancelled
};

inline std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}
