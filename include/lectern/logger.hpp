#pragma once

#include "export.hpp"

#include <string>
#include <vector>
#include <deque>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

enum class LogLevel {
	SERVER_ERROR,
	SERVER_WARNING,
	SERVER_INFO,
	SERVER_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class LECTERN_SERVER_API ServerLogger {
public:
	static ServerLogger& instance();

	ServerLogger(const ServerLogger&) = delete;
	ServerLogger& operator=(const ServerLogger&) = delete;
	ServerLogger(ServerLogger&&) = delete;
	ServerLogger& operator=(ServerLogger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel getLevel() const;

	// Parses DEBUG / INFO / WARN / WARNING / ERROR (case-insensitive).
	// Returns false and leaves `level` untouched for anything else.
	static bool parseLevel(const std::string& name, LogLevel& level);

	// Drop routine per-request INFO lines
	void setQuietMode(bool enabled);

	// Set log file path
	bool setLogFile(const std::string& filePath);

	// Log methods
	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Snapshot of the most recent entries (at most kLogRetention), oldest first
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

	static std::string levelToString(LogLevel level);

	static constexpr size_t kLogRetention = 1000;

private:
	ServerLogger();
	~ServerLogger();

	void log(LogLevel level, const std::string& message);
	bool enabled(LogLevel level) const;

	static std::string formatString(const char* format, va_list args);
	static std::string getCurrentTimestamp();

	std::atomic<LogLevel> minLevel;
#pragma warning(push)
#pragma warning(disable: 4251)
	std::deque<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
#pragma warning(pop)
	mutable std::mutex logMutex;

	bool quietMode;
};
