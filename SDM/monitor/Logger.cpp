#include "Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return os.str();
}
}

Logger::Logger() {}

Logger::~Logger() {
    stop();
}

bool Logger::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    file.open(path, std::ios::app);
    return file.is_open();
}

void Logger::setMinLevel(LogLevel level) {
    minLevel.store(level);
}

void Logger::setConsole(bool enabled) {
    console.store(enabled);
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    running.store(false);
    cv.notify_all();

    if (worker.joinable())
        worker.join();

    // messages logged without a running worker still reach the sinks
    std::lock_guard<std::mutex> lock(mtx);
    while (!messages.empty()) {
        write(messages.front());
        messages.pop();
    }
    if (file.is_open())
        file.flush();
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minLevel.load())
        return;

    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push({ level, "[" + timestamp() + "] " + levelName(level) + ": " + msg });
    }
    cv.notify_one();
}

void Logger::run() {
    while (running.load() || !messages.empty()) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            write(messages.front());
            messages.pop();
        }
    }
}

void Logger::write(const Entry& entry) {
    if (console.load()) {
        if (entry.level >= LogLevel::Warning)
            std::cerr << entry.line << std::endl;
        else
            std::cout << entry.line << std::endl;
    }

    if (file.is_open())
        file << entry.line << '\n';
}
