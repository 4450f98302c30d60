#include "ArgumentParser.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <map>
#include <stdexcept>
#include <vector>

namespace {
const unsigned long long kMaxKeepaliveSeconds = 3600;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        return s.substr(1, s.size() - 2);
    return s;
}

bool parseNumber(const std::string& text, unsigned long long& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        out = std::stoull(text);
    }
    catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool parseBackoff(const std::string& text, std::vector<std::chrono::seconds>& out) {
    std::vector<std::chrono::seconds> delays;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        unsigned long long value = 0;
        if (!parseNumber(trim(item), value))
            return false;
        delays.emplace_back(static_cast<std::chrono::seconds::rep>(value));
    }
    if (delays.empty())
        return false;
    out = delays;
    return true;
}

// flag -> config key
const std::map<std::string, std::string>& flagKeys() {
    static const std::map<std::string, std::string> keys = {
        { "-h", "SFTP_HOST" }, { "--host", "SFTP_HOST" },
        { "-p", "SFTP_PORT" }, { "--port", "SFTP_PORT" },
        { "-u", "SFTP_USER" }, { "--user", "SFTP_USER" },
        { "-w", "SFTP_PASS" }, { "--password", "SFTP_PASS" },
        { "-r", "SFTP_DIR" }, { "--remote-dir", "SFTP_DIR" },
        { "-l", "LOCAL_DIR" }, { "--local-dir", "LOCAL_DIR" },
        { "-d", "SERVER_DIR" }, { "--dist-dir", "SERVER_DIR" },
        { "-s", "LAST_FILE_RECORD" }, { "--state-file", "LAST_FILE_RECORD" },
        { "-m", "FILE_MARKER" }, { "--marker", "FILE_MARKER" },
        { "-c", "CHUNK_SIZE" }, { "--chunk-size", "CHUNK_SIZE" },
        { "-a", "MAX_RETRIES" }, { "--attempts", "MAX_RETRIES" },
        { "-b", "RETRY_BACKOFF" }, { "--backoff", "RETRY_BACKOFF" },
        { "-k", "KEEPALIVE_INTERVAL" }, { "--keepalive", "KEEPALIVE_INTERVAL" },
        { "--known-hosts", "KNOWN_HOSTS" },
        { "--log-file", "LOG_FILE" },
    };
    return keys;
}
}

bool ArgumentParser::parse(int argc, char* argv[], SessionConfig& out) {
    lastError.clear();

    // config file first so command-line flags override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                lastError = "--config requires a file";
                return false;
            }
            if (!loadConfigFile(argv[i + 1], out))
                return false;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            ++i;
        }
        else if (arg == "-v" || arg == "--verbose") {
            out.verbose = true;
        }
        else if (arg == "--help") {
            lastError = "help requested";
            return false;
        }
        else {
            auto it = flagKeys().find(arg);
            if (it == flagKeys().end() || i + 1 >= argc) {
                lastError = "unknown or incomplete option: " + arg;
                return false;
            }
            if (!apply(it->second, argv[++i], out))
                return false;
        }
    }

    return validate(out);
}

bool ArgumentParser::loadConfigFile(const std::string& path, SessionConfig& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        lastError = "cannot open config file " + path;
        return false;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            lastError = path + ":" + std::to_string(lineNo) + ": expected KEY=VALUE";
            return false;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        if (!apply(key, value, out))
            return false;
    }
    return true;
}

bool ArgumentParser::apply(const std::string& key, const std::string& value, SessionConfig& out) {
    unsigned long long number = 0;

    if (key == "SFTP_HOST") {
        out.host = value;
    }
    else if (key == "SFTP_PORT") {
        if (!parseNumber(value, number) || number == 0 || number > 65535) {
            lastError = "invalid port: " + value;
            return false;
        }
        out.port = static_cast<std::uint16_t>(number);
    }
    else if (key == "SFTP_USER") {
        out.username = value;
    }
    else if (key == "SFTP_PASS") {
        out.password = value;
    }
    else if (key == "SFTP_DIR") {
        out.remoteDir = value;
    }
    else if (key == "LOCAL_DIR") {
        out.localDir = value;
    }
    else if (key == "SERVER_DIR") {
        out.distributionDir = value;
    }
    else if (key == "LOG_FILE") {
        out.logFile = value;
    }
    else if (key == "LAST_FILE_RECORD") {
        out.recordPath = value;
    }
    else if (key == "FILE_MARKER") {
        out.fileMarker = value;
    }
    else if (key == "KNOWN_HOSTS") {
        out.knownHostsFile = value;
    }
    else if (key == "CHUNK_SIZE") {
        if (!parseNumber(value, number)) {
            lastError = "invalid chunk size: " + value;
            return false;
        }
        out.chunkSize = static_cast<std::size_t>(number);
    }
    else if (key == "MAX_RETRIES") {
        if (!parseNumber(value, number)) {
            lastError = "invalid attempt count: " + value;
            return false;
        }
        out.maxAttempts = static_cast<std::size_t>(number);
    }
    else if (key == "RETRY_BACKOFF") {
        if (!parseBackoff(value, out.backoff)) {
            lastError = "invalid backoff schedule: " + value;
            return false;
        }
    }
    else if (key == "KEEPALIVE_INTERVAL") {
        if (!parseNumber(value, number) || number > kMaxKeepaliveSeconds) {
            lastError = "invalid keepalive interval: " + value;
            return false;
        }
        out.keepaliveInterval = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(number));
    }
    else {
        lastError = "unknown setting: " + key;
        return false;
    }
    return true;
}

bool ArgumentParser::validate(const SessionConfig& cfg) {
    if (cfg.host.empty())
        lastError = "host is required";
    else if (cfg.username.empty())
        lastError = "user is required";
    else if (cfg.remoteDir.empty())
        lastError = "remote directory is required";
    else if (cfg.localDir.empty())
        lastError = "local directory is required";
    else if (cfg.recordPath.empty())
        lastError = "state file is required";
    else if (cfg.chunkSize == 0)
        lastError = "chunk size must be positive";
    else if (cfg.maxAttempts == 0)
        lastError = "attempts must be at least 1";
    else if (cfg.keepaliveInterval.count() <= 0
        || static_cast<unsigned long long>(cfg.keepaliveInterval.count()) > kMaxKeepaliveSeconds)
        lastError = "keepalive interval must be between 1 and " + std::to_string(kMaxKeepaliveSeconds) + " seconds";
    else if (cfg.backoff.empty())
        lastError = "backoff schedule must not be empty";
    else {
        for (std::size_t i = 1; i < cfg.backoff.size(); ++i) {
            if (cfg.backoff[i] <= cfg.backoff[i - 1]) {
                lastError = "backoff schedule must be strictly increasing";
                return false;
            }
        }
        return true;
    }
    return false;
}

void ArgumentParser::printUsage() const {
    std::cout <<
        "Usage:\n"
        "  sdm [--config <file>] [options]\n\n"
        "Options:\n"
        "  -h, --host <host>          SFTP server\n"
        "  -p, --port <port>          SFTP port (default: 22)\n"
        "  -u, --user <name>          Login name\n"
        "  -w, --password <secret>    Login password\n"
        "  -r, --remote-dir <dir>     Remote directory to scan\n"
        "  -l, --local-dir <dir>      Download directory\n"
        "  -d, --dist-dir <dir>       Copy finished files here too\n"
        "  -s, --state-file <file>    Last completed file record\n"
        "  -m, --marker <text>        Required name marker (default: IPI)\n"
        "  -c, --chunk-size <bytes>   Read size (default: 2MB)\n"
        "  -a, --attempts <n>         Attempts before giving up (default: 7)\n"
        "  -b, --backoff <s,s,...>    Delays between attempts (default: 5,10,30,60,120,300,600)\n"
        "  -k, --keepalive <seconds>  Keepalive interval (default: 15)\n"
        "      --known-hosts <file>   Verify the server key against this file\n"
        "      --log-file <file>      Append log lines to this file\n"
        "  -v, --verbose              Debug logging\n"
        "      --config <file>        KEY=VALUE settings (SFTP_HOST, SFTP_PORT, SFTP_USER, SFTP_PASS,\n"
        "                             SFTP_DIR, LOCAL_DIR, SERVER_DIR, LOG_FILE, LAST_FILE_RECORD, ...)\n";
}
