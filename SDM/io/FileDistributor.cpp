#include "FileDistributor.h"
#include <filesystem>

namespace fs = std::filesystem;

FileDistributor::FileDistributor(const std::string& directory)
    : targetDir(directory) {}

bool FileDistributor::place(const std::string& sourcePath, const std::string& fileName) {
    error.clear();

    std::error_code ec;
    fs::create_directories(targetDir, ec);
    if (ec) {
        error = "cannot create " + targetDir + ": " + ec.message();
        return false;
    }

    const fs::path dest = fs::path(targetDir) / fileName;
    fs::copy_file(sourcePath, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "cannot copy " + sourcePath + " to " + dest.string() + ": " + ec.message();
        return false;
    }

    // keep timestamps and mode like a metadata-preserving copy
    auto mtime = fs::last_write_time(sourcePath, ec);
    if (!ec)
        fs::last_write_time(dest, mtime, ec);
    if (ec) {
        error = "cannot copy modification time to " + dest.string() + ": " + ec.message();
        return false;
    }

    auto perms = fs::status(sourcePath, ec).permissions();
    if (!ec)
        fs::permissions(dest, perms, fs::perm_options::replace, ec);
    if (ec) {
        error = "cannot copy permissions to " + dest.string() + ": " + ec.message();
        return false;
    }

    return true;
}
