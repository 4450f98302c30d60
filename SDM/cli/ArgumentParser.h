#pragma once
#include <string>
#include "../core/utils.h"

class ArgumentParser {
public:
    bool parse(int argc, char* argv[], SessionConfig& out);
    bool loadConfigFile(const std::string& path, SessionConfig& out);

    const std::string& error() const { return lastError; }
    void printUsage() const;

private:
    bool apply(const std::string& key, const std::string& value, SessionConfig& out);
    bool validate(const SessionConfig& cfg);

private:
    std::string lastError;
};
