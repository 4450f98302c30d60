#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <fstream>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

class Logger {
public:
    Logger();
    ~Logger();

    bool openFile(const std::string& path);
    void setMinLevel(LogLevel level);
    void setConsole(bool enabled);

    void start();
    void stop();

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warning(const std::string& msg) { log(LogLevel::Warning, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    struct Entry {
        LogLevel level;
        std::string line;
    };

    void run();
    void write(const Entry& entry);

private:
    std::queue<Entry> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::atomic<LogLevel> minLevel{ LogLevel::Info };
    std::atomic<bool> console{ true };
    std::ofstream file;
    std::thread worker;
};
