#include "ChunkedReader.h"
#include "errors.h"

#include <algorithm>

ChunkedReader::ChunkedReader(RemoteChannel& channel,
    const std::string& remotePath,
    std::uint64_t startOffset,
    std::uint64_t totalSize,
    std::size_t chunkSize)
    : remote(channel),
    path(remotePath),
    pos(startOffset),
    total(totalSize),
    chunk(chunkSize) {
    if (chunk == 0)
        throw TransferError("chunk size must be positive");
}

bool ChunkedReader::next(std::vector<char>& out) {
    if (failed)
        throw TransferError("reader for " + path + " already failed at offset " + std::to_string(pos));

    out.clear();
    if (done || pos >= total) {
        done = true;
        return false;
    }

    const std::uint64_t request = std::min<std::uint64_t>(chunk, total - pos);
    out.reserve(static_cast<std::size_t>(request));

    bool ok = remote.readRange(path, pos, request,
        [&](const char* data, std::size_t size) {
            if (out.size() + size > request)
                return false;
            out.insert(out.end(), data, data + size);
            return true;
        });

    if (!ok) {
        failed = true;
        out.clear();
        std::string reason = remote.lastError();
        throw TransferError("chunk read at offset " + std::to_string(pos) + " failed" +
            (reason.empty() ? "" : ": " + reason));
    }

    // zero bytes means end of file on the remote side
    if (out.empty()) {
        done = true;
        return false;
    }

    pos += out.size();
    return true;
}
