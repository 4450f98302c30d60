#include "TransferRecord.h"
#include <fstream>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
}

TransferRecord::TransferRecord(const std::string& path)
    : recordPath(path) {}

bool TransferRecord::exists() const {
    return fs::exists(recordPath);
}

std::optional<std::string> TransferRecord::load() const {
    std::ifstream in(recordPath);
    if (!in.is_open())
        return std::nullopt;

    std::ostringstream content;
    content << in.rdbuf();

    std::string name = trim(content.str());
    if (name.empty())
        return std::nullopt;
    return name;
}

bool TransferRecord::save(const std::string& fileName) {
    const std::string tmpPath = recordPath + ".tmp";
    error.clear();

    fs::path parent = fs::path(recordPath).parent_path();
    if (!parent.empty()) {
        std::error_code mk;
        fs::create_directories(parent, mk);
    }

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + tmpPath + " for writing";
            return false;
        }

        out << fileName;
        out.flush();
        if (!out) {
            error = "cannot write " + tmpPath;
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, recordPath, ec);

    if (ec) {
        error = "cannot replace " + recordPath + ": " + ec.message();
        fs::remove(tmpPath, ec);
        return false;
    }

    return true;
}
