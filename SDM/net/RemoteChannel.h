#pragma once
#include <string>
#include <vector>
#include <functional>
#include <cstdint>

struct RemoteStat {
    std::uint64_t size = 0;
};

// One authenticated session to the remote file server.
// Methods report failure through the return value and lastError().
class RemoteChannel {
public:
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~RemoteChannel() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // false when the file is missing or the server does not report its size
    virtual bool stat(const std::string& path, RemoteStat& out) = 0;
    virtual bool listDirectory(const std::string& path, std::vector<std::string>& out) = 0;
    virtual bool readRange(const std::string& path,
        std::uint64_t offset,
        std::uint64_t size,
        const DataCallback& onData) = 0;

    // zero-payload round trip; false when the session no longer answers
    virtual bool probe() = 0;
    virtual void keepAlive() = 0;

    virtual const std::string& lastError() const = 0;
};
