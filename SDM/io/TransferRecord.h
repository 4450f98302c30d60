#pragma once
#include <string>
#include <optional>

// Single-line record of the last file that was fully transferred.
class TransferRecord
{
public:
    explicit TransferRecord(const std::string& path);

    bool exists() const;
    std::optional<std::string> load() const;
    bool save(const std::string& fileName);

    const std::string& lastError() const { return error; }

private:
    std::string recordPath;
    std::string error;
};
