#pragma once
#include <string>

class FileDistributor
{
public:
    explicit FileDistributor(const std::string& directory);

    bool enabled() const { return !targetDir.empty(); }
    bool place(const std::string& sourcePath, const std::string& fileName);

    const std::string& directory() const { return targetDir; }
    const std::string& lastError() const { return error; }

private:
    std::string targetDir;
    std::string error;
};
