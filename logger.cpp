#include "logger.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

    struct LoggerState {
        std::mutex mutex;
        LoggerConfig config;
        std::ofstream file;
        bool fileOpened = false;   // попытка открыть уже была
    };

    LoggerState& state() {
        static LoggerState s;
        return s;
    }

    const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    std::string timestamp() {
        std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
    #if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    // короткий номер потока: t1, t2 ... в порядке первого сообщения
    std::string threadTag() {
        static std::atomic<int> next{1};
        thread_local const std::string tag = "t" + std::to_string(next++);
        return tag;
    }

    // под state().mutex
    void openFileOnce(LoggerState& s) {
        if (s.fileOpened) return;
        s.fileOpened = true;
        if (s.config.filePath.empty()) return;

        s.file.open(s.config.filePath, std::ios::out | std::ios::app);
        if (!s.file.is_open()) {
            std::cerr << "[logger] не удалось открыть " << s.config.filePath
                      << ", пишем только в stderr\n";
        }
    }
}

void initLogger(const LoggerConfig& cfg) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();
    s.config = cfg;
    s.fileOpened = false;
    openFileOnce(s);
}

LogLevel logLevelFromString(const std::string& s) {
    if (s == "debug")   return LogLevel::Debug;
    if (s == "info")    return LogLevel::Info;
    if (s == "warning" || s == "warn") return LogLevel::Warning;
    if (s == "error")   return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + s);
}

std::string formatLogLine(LogLevel level, const std::string& tag, const std::string& msg) {
    return "[" + timestamp() + "][" + levelName(level) + "][" + tag + "] " + msg;
}

void logMessage(LogLevel level, const std::string& msg) {
    std::string line = formatLogLine(level, threadTag(), msg) + "\n";

    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.config.minLevel) return;
    openFileOnce(s);

    if (s.file.is_open()) {
        s.file << line;
        s.file.flush();
    }
    // stdout занят JSON-выводом CLI
    if (s.config.toStderr) std::cerr << line;
}

void logInfo(const std::string& msg)    { logMessage(LogLevel::Info, msg); }
void logWarning(const std::string& msg) { logMessage(LogLevel::Warning, msg); }
void logError(const std::string& msg)   { logMessage(LogLevel::Error, msg); }
void logDebug(const std::string& msg)   { logMessage(LogLevel::Debug, msg); }
