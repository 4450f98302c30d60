#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

class FileWriter
{
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    bool open(bool append);
    bool write(const char* data, std::size_t size);
    bool flush();
    void close();

    bool isOpen() const { return fileHandle >= 0; }
    std::uint64_t written() const { return bytesWritten; }

private:
    std::string filePath;
    std::uint64_t bytesWritten = 0;
    int fileHandle = -1;
};
