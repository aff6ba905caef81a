#include <string>

#pragma once

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

struct LoggerConfig {
    std::string filePath = "labsched.log";   // пустая строка = без файла
    LogLevel minLevel    = LogLevel::Info;
    bool toStderr        = true;
};

// Можно не вызывать: тогда используются значения по умолчанию.
void initLogger(const LoggerConfig& cfg);

// "debug" / "info" / "warning" / "error", бросает std::invalid_argument
LogLevel logLevelFromString(const std::string& s);

// "[2025-01-10 09:30:00][INFO][t1] msg" без перевода строки
std::string formatLogLine(LogLevel level, const std::string& threadTag, const std::string& msg);

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);
