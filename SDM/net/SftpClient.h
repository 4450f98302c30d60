#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "RemoteChannel.h"
#include "../core/utils.h"

class Logger;

// One SSH session over a socket owned by this class, carrying a single SFTP
// subsystem channel. Stats, listings, reads, probes and keepalives all travel
// over that session until close().
class SftpClient : public RemoteChannel {
public:
    struct SocketTuning {
        bool keepalive = false;
        bool idle = false;
        bool interval = false;
        bool count = false;

        bool complete() const { return keepalive && idle && interval && count; }
    };

    // SO_KEEPALIVE plus idle/interval/count where the platform has them
    static SocketTuning tuneKeepalive(int fd, const TcpKeepalive& opts);
    static std::string describeTuning(const SocketTuning& tuning, const TcpKeepalive& opts);

    SftpClient(const SessionConfig& config, Logger& logger);
    ~SftpClient() override;

    SftpClient(const SftpClient&) = delete;
    SftpClient& operator=(const SftpClient&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override { return opened; }

    bool stat(const std::string& path, RemoteStat& out) override;
    bool listDirectory(const std::string& path, std::vector<std::string>& out) override;
    bool readRange(const std::string& path,
        std::uint64_t offset,
        std::uint64_t size,
        const DataCallback& onData) override;

    bool probe() override;
    void keepAlive() override;

    const std::string& lastError() const override { return error; }

private:
    bool connectSocket();
    bool startSession();
    bool verifyHostKey();
    bool authenticate();
    void widenWindow();
    void shutdown();
    void dropReadHandle();
    bool fail(const std::string& what);
    void logHardening();

private:
    const SessionConfig& cfg;
    Logger& log;
    int sock = -1;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    LIBSSH2_SFTP_HANDLE* readHandle = nullptr;
    std::string readPath;
    std::uint64_t window = 0;
    std::string error;
    bool opened = false;
    SocketTuning tuning;
};
