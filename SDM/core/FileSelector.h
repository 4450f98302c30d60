#pragma once
#include <string>
#include <vector>
#include <optional>

#include "utils.h"
#include "../net/RemoteChannel.h"

class FileSelector {
public:
    FileSelector(RemoteChannel& channel, const std::string& remoteDir, const std::string& marker);

    // Throws TransferError when the directory cannot be listed.
    std::vector<RemoteFileDescriptor> listCandidates();

    static std::optional<std::string> extractDateToken(const std::string& name);
    static std::string digitsOf(const std::string& name);

    // earliest candidate dated strictly after the last recorded file
    static std::optional<RemoteFileDescriptor> select(const std::vector<RemoteFileDescriptor>& candidates,
        const std::optional<std::string>& lastRecorded);

private:
    RemoteChannel& remote;
    std::string directory;
    std::string fileMarker;
};
