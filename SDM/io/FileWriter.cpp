#include "FileWriter.h"

#include <cerrno>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#endif

FileWriter::FileWriter(const std::string& path)
    : filePath(path) {
}

FileWriter::~FileWriter() {
    close();
}

bool FileWriter::open(bool append) {
#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT | (append ? _O_APPEND : _O_TRUNC);
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT | (append ? O_APPEND : O_TRUNC);
    int mode = 0644;
    fileHandle = ::open(filePath.c_str(), flags, mode);
#endif

    bytesWritten = 0;
    return fileHandle >= 0;
}

bool FileWriter::write(const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    std::size_t done = 0;
    while (done < size) {
#ifdef _WIN32
        int n = _write(fileHandle, data + done, static_cast<unsigned int>(size - done));
#else
        ssize_t n = ::write(fileHandle, data + done, size - done);
#endif
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }

    bytesWritten += size;
    return true;
}

bool FileWriter::flush() {
    if (fileHandle < 0)
        return false;
#ifdef _WIN32
    return _commit(fileHandle) == 0;
#else
    return fsync(fileHandle) == 0;
#endif
}

void FileWriter::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}
