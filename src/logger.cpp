#include "lectern/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

ServerLogger::ServerLogger() : minLevel(LogLevel::SERVER_INFO), quietMode(false)
{
}

ServerLogger::~ServerLogger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

ServerLogger &ServerLogger::instance()
{
    static ServerLogger instance;
    return instance;
}

void ServerLogger::setLevel(LogLevel level)
{
    minLevel.store(level);
}

LogLevel ServerLogger::getLevel() const
{
    return minLevel.load();
}

bool ServerLogger::parseLevel(const std::string &name, LogLevel &level)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG")
        level = LogLevel::SERVER_DEBUG;
    else if (upper == "INFO")
        level = LogLevel::SERVER_INFO;
    else if (upper == "WARN" || upper == "WARNING")
        level = LogLevel::SERVER_WARNING;
    else if (upper == "ERROR")
        level = LogLevel::SERVER_ERROR;
    else
        return false;
    return true;
}

void ServerLogger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

bool ServerLogger::setLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (logFile.is_open())
    {
        logFile.close();
    }

    logFilePath = filePath;
    logFile.open(filePath, std::ios::app);

    if (!logFile.is_open())
    {
        std::cerr << "Failed to open log file: " << filePath << std::endl;
        return false;
    }

    return true;
}

bool ServerLogger::enabled(LogLevel level) const
{
    return level <= minLevel.load();
}

void ServerLogger::error(const std::string &message)
{
    log(LogLevel::SERVER_ERROR, message);
}

void ServerLogger::warning(const std::string &message)
{
    log(LogLevel::SERVER_WARNING, message);
}

void ServerLogger::info(const std::string &message)
{
    log(LogLevel::SERVER_INFO, message);
}

void ServerLogger::debug(const std::string &message)
{
    log(LogLevel::SERVER_DEBUG, message);
}

void ServerLogger::error(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_ERROR))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_ERROR, formattedMsg);
}

void ServerLogger::warning(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_WARNING))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_WARNING, formattedMsg);
}

void ServerLogger::info(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_INFO))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_INFO, formattedMsg);
}

void ServerLogger::debug(const char *format, ...)
{
    if (!enabled(LogLevel::SERVER_DEBUG))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::SERVER_DEBUG, formattedMsg);
}

void ServerLogger::logError(const std::string &message)
{
    instance().error(message);
}

void ServerLogger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void ServerLogger::logInfo(const std::string &message)
{
    instance().info(message);
}

void ServerLogger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void ServerLogger::logError(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_ERROR))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_ERROR, formattedMsg);
}

void ServerLogger::logWarning(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_WARNING))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_WARNING, formattedMsg);
}

void ServerLogger::logInfo(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_INFO))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_INFO, formattedMsg);
}

void ServerLogger::logDebug(const char *format, ...)
{
    if (!instance().enabled(LogLevel::SERVER_DEBUG))
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().log(LogLevel::SERVER_DEBUG, formattedMsg);
}

std::vector<LogEntry> ServerLogger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return std::vector<LogEntry>(logs.begin(), logs.end());
}

void ServerLogger::clearLogs()
{
    std::lock_guard<std::mutex> lock(logMutex);
    logs.clear();
}

std::string ServerLogger::formatString(const char *format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, format, argsCopy) + 1; // +1 for null terminator
    va_end(argsCopy);

    if (size <= 0)
    {
        return "Error formatting string";
    }

    std::vector<char> buffer(size);

    vsnprintf(buffer.data(), size, format, args);

    return std::string(buffer.data(), buffer.data() + size - 1);
}

void ServerLogger::log(LogLevel level, const std::string &message)
{
    if (!enabled(level))
    {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex);

    // Routine per-request traffic is noise in quiet mode
    if (quietMode && level == LogLevel::SERVER_INFO)
    {
        if (message.find("New client connection") != std::string::npos ||
            message.find("Processing request") != std::string::npos ||
            message.find("Completed request") != std::string::npos ||
            message.find("Served chunk") != std::string::npos ||
            message.find("Reported status") != std::string::npos)
        {
            return;
        }
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = levelToString(level);

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelStr << "] " << message;
    std::string formattedMessage = logStream.str();

    logs.push_back(LogEntry{level, timestamp, message});
    if (logs.size() > kLogRetention)
    {
        logs.pop_front();
    }

    if (level == LogLevel::SERVER_ERROR)
    {
        std::cerr << formattedMessage << std::endl;
    }
    else
    {
        std::cout << formattedMessage << std::endl;
    }

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
        logFile.flush();
    }
}

std::string ServerLogger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::SERVER_ERROR:
        return "ERROR";
    case LogLevel::SERVER_WARNING:
        return "WARNING";
    case LogLevel::SERVER_INFO:
        return "INFO";
    case LogLevel::SERVER_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string ServerLogger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &time_t);
#else
    localtime_r(&time_t, &localTm);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
