#include "FileSelector.h"
#include "errors.h"

#include <cctype>

FileSelector::FileSelector(RemoteChannel& channel, const std::string& remoteDir, const std::string& marker)
    : remote(channel), directory(remoteDir), fileMarker(marker) {
}

std::vector<RemoteFileDescriptor> FileSelector::listCandidates() {
    std::vector<std::string> names;
    if (!remote.listDirectory(directory, names))
        throw TransferError(remote.lastError().empty() ? "cannot list " + directory : remote.lastError());

    std::vector<RemoteFileDescriptor> out;
    for (const auto& name : names) {
        if (name.find(fileMarker) == std::string::npos)
            continue;

        auto token = extractDateToken(name);
        if (!token)
            continue;

        out.push_back({ name, *token });
    }
    return out;
}

std::string FileSelector::digitsOf(const std::string& name) {
    std::string digits;
    for (char ch : name) {
        if (std::isdigit(static_cast<unsigned char>(ch)))
            digits.push_back(ch);
    }
    return digits;
}

std::optional<std::string> FileSelector::extractDateToken(const std::string& name) {
    std::string digits = digitsOf(name);
    if (digits.size() != 8)
        return std::nullopt;
    return digits;
}

std::optional<RemoteFileDescriptor> FileSelector::select(const std::vector<RemoteFileDescriptor>& candidates,
    const std::optional<std::string>& lastRecorded) {
    std::string lastToken;
    if (lastRecorded)
        lastToken = digitsOf(*lastRecorded);

    std::optional<RemoteFileDescriptor> best;
    for (const auto& candidate : candidates) {
        if (!lastToken.empty() && !(candidate.dateToken > lastToken))
            continue;

        if (!best
            || candidate.dateToken < best->dateToken
            || (candidate.dateToken == best->dateToken && candidate.name < best->name)) {
            best = candidate;
        }
    }
    return best;
}
