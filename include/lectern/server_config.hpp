#pragma once

#include <string>
#include <chrono>
#include "export.hpp"

namespace lectern {

/**
 * @brief Settings of the speech synthesis backend
 */
struct SynthesisConfig {
    std::string url = "http://127.0.0.1:5050/v1/audio/speech";
    std::string voice = "en-US-AriaNeural";
    std::string rate = "+0%";
    std::string volume = "+0%";
    std::string format = "mp3";
    int timeout = 60;                  // Request timeout in seconds
    std::string apiKey;                // Sent as a bearer token when set

    SynthesisConfig() = default;
};

/**
 * @brief Server startup configuration
 */
struct LECTERN_SERVER_API ServerConfig {
#pragma warning(push)
#pragma warning(disable: 4251)
    // Basic server settings
    std::string port = "8080";
    std::string host = "0.0.0.0";
    size_t maxUploadBytes = 52428800;  // Largest accepted request body

    // Logging configuration
    std::string logLevel = "INFO";     // DEBUG, INFO, WARN, ERROR
    std::string logFile = "";          // Empty means console only
    bool quietMode = false;            // Suppress routine per-request messages

    // Chunking
    int maxChunkSize = 2000;           // Characters per chunk

    // Sessions
    std::chrono::seconds sessionIdleTimeout{3600}; // 0 disables expiry
    size_t maxSessions = 0;            // 0 means unlimited

    SynthesisConfig synthesis;

    // Upload spooling directory; empty means <system temp>/lectern
    std::string tempDir = "";

    // Internal flags
    bool helpOrVersionShown = false;

    std::string currentConfigFilePath;
#pragma warning(pop)

    ServerConfig() = default;

    /**
     * @brief Load configuration from command line arguments
     *
     * Without -c/--config the first of /etc/lectern/config.yaml, ./config.yaml
     * and ~/.lectern/config.yaml that exists is loaded first. Flags override
     * file values.
     *
     * @return True if configuration was loaded and is valid
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from YAML file
     * @param configFile Path to configuration file
     * @return True if configuration was loaded successfully
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Save current configuration to YAML file
     */
    bool saveToFile(const std::string& configFile) const;

    const std::string& getCurrentConfigFilePath() const;

    /**
     * @brief Validate the configuration; problems are reported on stderr
     */
    bool validate() const;

    void printSummary() const;

    static void printHelp();
    static void printVersion();
};

} // namespace lectern
