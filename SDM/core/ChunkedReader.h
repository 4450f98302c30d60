#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "../net/RemoteChannel.h"

// Streams a remote file in fixed-size chunks from a starting offset.
// Single pass: after a failed read the reader is unusable and the caller
// opens a new one at the updated offset.
class ChunkedReader {
public:
    ChunkedReader(RemoteChannel& channel,
        const std::string& remotePath,
        std::uint64_t startOffset,
        std::uint64_t totalSize,
        std::size_t chunkSize);

    bool next(std::vector<char>& chunk);

    std::uint64_t position() const { return pos; }
    bool finished() const { return done; }

private:
    RemoteChannel& remote;
    std::string path;
    std::uint64_t pos;
    std::uint64_t total;
    std::size_t chunk;
    bool done = false;
    bool failed = false;
};
