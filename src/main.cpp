#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include "lectern/server_api.hpp"
#include "lectern/server_config.hpp"
#include "lectern/logger.hpp"

using namespace lectern;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

void signal_handler(int signal)
{
    std::cout << "\nReceived signal " << signal << ", shutting down gracefully..." << std::endl;
    keep_running = false;
}

int main(int argc, char *argv[])
{
    ServerConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        if (config.helpOrVersionShown)
        {
            return 0;
        }
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef _WIN32
    std::signal(SIGBREAK, signal_handler);
#else
    // A client hanging up mid-response must not kill the process
    std::signal(SIGPIPE, SIG_IGN);
#endif

    std::cout << "Starting Lectern Server v1.0.0..." << std::endl;
    config.printSummary();

    auto &logger = ServerLogger::instance();
    LogLevel logLevel = LogLevel::SERVER_INFO;
    ServerLogger::parseLevel(config.logLevel, logLevel);
    logger.setLevel(logLevel);
    logger.setQuietMode(config.quietMode);

    if (!config.logFile.empty())
    {
        if (!logger.setLogFile(config.logFile))
        {
            std::cerr << "Warning: Failed to open log file: " << config.logFile << std::endl;
        }
    }

    ServerLogger::logInfo("Logger configured - Level: %s, Quiet: %s",
                          config.logLevel.c_str(),
                          config.quietMode ? "true" : "false");

    ServerAPI &server = ServerAPI::instance();
    if (!server.init(config))
    {
        std::cerr << "Failed to initialize server on " << config.host << ":" << config.port << std::endl;
        return 1;
    }

    std::cout << "\nServer started successfully!" << std::endl;
    if (config.host == "0.0.0.0" || config.host == "::")
    {
        std::cout << "Server URL: http://127.0.0.1:" << config.port << " (all interfaces)" << std::endl;
    }
    else
    {
        std::cout << "Server URL: http://" << config.host << ":" << config.port << std::endl;
    }

    std::cout << "\nAvailable endpoints:" << std::endl;
    std::cout << "  GET  /health                      - Health status" << std::endl;
    std::cout << "  GET  /logs                        - Recent server log entries" << std::endl;
    std::cout << "  POST /pdf/upload                  - Upload a PDF and open a reading session" << std::endl;
    std::cout << "  GET  /pdf/{session_id}/read/{n}   - Speech audio for chunk n" << std::endl;
    std::cout << "  GET  /pdf/{session_id}/status     - Reading position of a session" << std::endl;
    std::cout << "  POST /tts                         - Synthesize arbitrary text" << std::endl;
    std::cout << "  POST /synth                       - Alias of /tts" << std::endl;

    std::cout << "\nPress Ctrl+C to stop the server..." << std::endl;

    while (keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "Shutting down server..." << std::endl;
    server.shutdown();
    std::cout << "Server stopped." << std::endl;

    return 0;
}
