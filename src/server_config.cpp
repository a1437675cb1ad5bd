#include "lectern/server_config.hpp"
#include "lectern/logger.hpp"
#include "lectern/synthesis/speech_synthesizer.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace lectern
{
    namespace
    {
        std::vector<std::string> defaultConfigPaths()
        {
            std::vector<std::string> paths = {"/etc/lectern/config.yaml", "config.yaml"};
            const char *homeDir = std::getenv("HOME");
            if (homeDir)
            {
                paths.push_back(std::string(homeDir) + "/.lectern/config.yaml");
            }
            return paths;
        }

        bool hasExplicitConfig(int argc, char *argv[])
        {
            for (int i = 1; i < argc; i++)
            {
                std::string arg = argv[i];
                if (arg == "-c" || arg == "--config")
                {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    bool ServerConfig::loadFromArgs(int argc, char *argv[])
    {
        // Configuration files are only searched for when none is named on the command line
        if (!hasExplicitConfig(argc, argv))
        {
            bool configLoaded = false;
            for (const auto &path : defaultConfigPaths())
            {
                std::ifstream file(path);
                if (!file.good())
                {
                    continue;
                }
                file.close();
                if (loadFromFile(path))
                {
                    currentConfigFilePath = std::filesystem::absolute(path).string();
                    ServerLogger::logInfo("Loaded configuration from %s", currentConfigFilePath.c_str());
                    configLoaded = true;
                    break;
                }
            }

            if (!configLoaded)
            {
                ServerLogger::logInfo("No configuration file found, using default settings");
            }
        }

        // Process command line arguments (they can override config file settings)
        try
        {
            for (int i = 1; i < argc; i++)
            {
                std::string arg = argv[i];

                // Basic server options
                if ((arg == "-p" || arg == "--port") && i + 1 < argc)
                {
                    port = argv[++i];
                }
                else if ((arg == "--host") && i + 1 < argc)
                {
                    host = argv[++i];
                }
                else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
                {
                    std::string configFile = argv[++i];
                    if (!loadFromFile(configFile))
                    {
                        return false;
                    }
                    currentConfigFilePath = std::filesystem::absolute(configFile).string();
                    ServerLogger::logInfo("Loaded configuration from %s", configFile.c_str());
                }

                // Logging options
                else if ((arg == "--log-level") && i + 1 < argc)
                {
                    logLevel = argv[++i];
                }
                else if ((arg == "--log-file") && i + 1 < argc)
                {
                    logFile = argv[++i];
                }
                else if (arg == "--quiet")
                {
                    quietMode = true;
                }

                // Chunking and sessions
                else if ((arg == "--max-chunk-size") && i + 1 < argc)
                {
                    maxChunkSize = std::stoi(argv[++i]);
                }
                else if ((arg == "--session-timeout") && i + 1 < argc)
                {
                    sessionIdleTimeout = std::chrono::seconds(std::stoll(argv[++i]));
                }
                else if ((arg == "--max-sessions") && i + 1 < argc)
                {
                    maxSessions = std::stoul(argv[++i]);
                }

                // Synthesis
                else if ((arg == "--tts-url") && i + 1 < argc)
                {
                    synthesis.url = argv[++i];
                }
                else if ((arg == "--voice") && i + 1 < argc)
                {
                    synthesis.voice = argv[++i];
                }

                // Uploads
                else if ((arg == "--temp-dir") && i + 1 < argc)
                {
                    tempDir = argv[++i];
                }

                // Help and version
                else if (arg == "-h" || arg == "--help")
                {
                    printHelp();
                    helpOrVersionShown = true;
                    return false;
                }
                else if (arg == "-v" || arg == "--version")
                {
                    printVersion();
                    helpOrVersionShown = true;
                    return false;
                }
                else
                {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
            }
        }
        catch (const std::logic_error &e)
        {
            // std::stoi and friends throw invalid_argument / out_of_range
            std::cerr << "Invalid numeric value on command line: " << e.what() << std::endl;
            return false;
        }

        return validate();
    }

    bool ServerConfig::loadFromFile(const std::string &configFile)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(configFile);

            if (config["server"])
            {
                auto server = config["server"];
                if (server["port"])
                    port = server["port"].as<std::string>();
                if (server["host"])
                    host = server["host"].as<std::string>();
                if (server["max_upload_bytes"])
                    maxUploadBytes = server["max_upload_bytes"].as<size_t>();
            }

            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = logging["level"].as<std::string>();
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["quiet_mode"])
                    quietMode = logging["quiet_mode"].as<bool>();
            }

            if (config["chunking"])
            {
                auto chunking = config["chunking"];
                if (chunking["max_chunk_size"])
                    maxChunkSize = chunking["max_chunk_size"].as<int>();
            }

            if (config["sessions"])
            {
                auto sessions = config["sessions"];
                if (sessions["idle_timeout"])
                    sessionIdleTimeout = std::chrono::seconds(sessions["idle_timeout"].as<long long>());
                if (sessions["max_sessions"])
                    maxSessions = sessions["max_sessions"].as<size_t>();
            }

            if (config["synthesis"])
            {
                auto synth = config["synthesis"];
                if (synth["url"])
                    synthesis.url = synth["url"].as<std::string>();
                if (synth["voice"])
                    synthesis.voice = synth["voice"].as<std::string>();
                if (synth["rate"])
                    synthesis.rate = synth["rate"].as<std::string>();
                if (synth["volume"])
                    synthesis.volume = synth["volume"].as<std::string>();
                if (synth["format"])
                    synthesis.format = synth["format"].as<std::string>();
                if (synth["timeout"])
                    synthesis.timeout = synth["timeout"].as<int>();
                if (synth["api_key"])
                    synthesis.apiKey = synth["api_key"].as<std::string>();
            }

            if (config["upload"])
            {
                auto upload = config["upload"];
                if (upload["temp_dir"])
                    tempDir = upload["temp_dir"].as<std::string>();
            }

            return validate();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error parsing config file " << configFile << ": " << e.what() << std::endl;
            return false;
        }
    }

    bool ServerConfig::saveToFile(const std::string &configFile) const
    {
        try
        {
            YAML::Emitter out;
            out << YAML::BeginMap;

            out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "port" << YAML::Value << port;
            out << YAML::Key << "host" << YAML::Value << host;
            out << YAML::Key << "max_upload_bytes" << YAML::Value << maxUploadBytes;
            out << YAML::EndMap;

            out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "level" << YAML::Value << logLevel;
            out << YAML::Key << "file" << YAML::Value << logFile;
            out << YAML::Key << "quiet_mode" << YAML::Value << quietMode;
            out << YAML::EndMap;

            out << YAML::Key << "chunking" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "max_chunk_size" << YAML::Value << maxChunkSize;
            out << YAML::EndMap;

            out << YAML::Key << "sessions" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "idle_timeout" << YAML::Value << static_cast<long long>(sessionIdleTimeout.count());
            out << YAML::Key << "max_sessions" << YAML::Value << maxSessions;
            out << YAML::EndMap;

            out << YAML::Key << "synthesis" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "url" << YAML::Value << synthesis.url;
            out << YAML::Key << "voice" << YAML::Value << synthesis.voice;
            out << YAML::Key << "rate" << YAML::Value << synthesis.rate;
            out << YAML::Key << "volume" << YAML::Value << synthesis.volume;
            out << YAML::Key << "format" << YAML::Value << synthesis.format;
            out << YAML::Key << "timeout" << YAML::Value << synthesis.timeout;
            if (!synthesis.apiKey.empty())
                out << YAML::Key << "api_key" << YAML::Value << synthesis.apiKey;
            out << YAML::EndMap;

            out << YAML::Key << "upload" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "temp_dir" << YAML::Value << tempDir;
            out << YAML::EndMap;

            out << YAML::EndMap;

            std::ofstream file(configFile);
            if (!file.is_open())
            {
                std::cerr << "Error: Cannot open config file for writing: " << configFile << std::endl;
                return false;
            }
            file << out.c_str();
            return file.good();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error saving config file " << configFile << ": " << e.what() << std::endl;
            return false;
        }
    }

    bool ServerConfig::validate() const
    {
        if (port.empty())
        {
            std::cerr << "Error: Port cannot be empty" << std::endl;
            return false;
        }
        try
        {
            int portNum = std::stoi(port);
            if (portNum < 1 || portNum > 65535)
            {
                std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                return false;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: Invalid port number: " << port << std::endl;
            return false;
        }

        LogLevel level;
        if (!ServerLogger::parseLevel(logLevel, level))
        {
            std::cerr << "Error: Invalid log level: " << logLevel << std::endl;
            return false;
        }

        if (maxChunkSize < 1)
        {
            std::cerr << "Error: max_chunk_size must be at least 1" << std::endl;
            return false;
        }

        if (sessionIdleTimeout.count() < 0)
        {
            std::cerr << "Error: Session idle timeout cannot be negative" << std::endl;
            return false;
        }

        if (maxUploadBytes == 0)
        {
            std::cerr << "Error: max_upload_bytes must be positive" << std::endl;
            return false;
        }

        if (synthesis.url.empty())
        {
            std::cerr << "Error: Synthesis URL cannot be empty" << std::endl;
            return false;
        }

        if (!synthesis::isValidPercentage(synthesis.rate))
        {
            std::cerr << "Error: Synthesis rate must be a percentage between -100% and +100%: " << synthesis.rate << std::endl;
            return false;
        }

        if (!synthesis::isValidPercentage(synthesis.volume))
        {
            std::cerr << "Error: Synthesis volume must be a percentage between -100% and +100%: " << synthesis.volume << std::endl;
            return false;
        }

        if (synthesis.timeout < 1)
        {
            std::cerr << "Error: Synthesis timeout must be at least 1 second" << std::endl;
            return false;
        }

        return true;
    }

    void ServerConfig::printSummary() const
    {
        std::cout << "=== Lectern Server Configuration ===" << std::endl;
        std::cout << "Server:" << std::endl;
        std::cout << "  Port: " << port << std::endl;
        std::cout << "  Host: " << host << std::endl;
        std::cout << "  Max Upload: " << maxUploadBytes << " bytes" << std::endl;

        std::cout << "\nLogging:" << std::endl;
        std::cout << "  Level: " << logLevel << std::endl;
        std::cout << "  File: " << (logFile.empty() ? "Console" : logFile) << std::endl;
        std::cout << "  Quiet: " << (quietMode ? "Yes" : "No") << std::endl;

        std::cout << "\nDocuments:" << std::endl;
        std::cout << "  Max Chunk Size: " << maxChunkSize << std::endl;
        std::cout << "  Temp Dir: " << (tempDir.empty() ? "<system temp>/lectern" : tempDir) << std::endl;

        std::cout << "\nSessions:" << std::endl;
        std::cout << "  Idle Timeout: " << (sessionIdleTimeout.count() == 0 ? std::string("Disabled")
                                                                          : std::to_string(sessionIdleTimeout.count()) + "s")
                  << std::endl;
        std::cout << "  Max Sessions: " << (maxSessions == 0 ? std::string("Unlimited") : std::to_string(maxSessions)) << std::endl;

        std::cout << "\nSynthesis:" << std::endl;
        std::cout << "  URL: " << synthesis.url << std::endl;
        std::cout << "  Voice: " << synthesis.voice << std::endl;
        std::cout << "  Rate/Volume: " << synthesis.rate << " / " << synthesis.volume << std::endl;
        std::cout << "  Timeout: " << synthesis.timeout << "s" << std::endl;
        std::cout << "====================================" << std::endl;
    }

    void ServerConfig::printHelp()
    {
        std::cout << "Lectern Server v1.0.0 - Read documents aloud, one chunk at a time\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    lectern-server [OPTIONS]\n\n";
        std::cout << "OPTIONS:\n";
        std::cout << "  Basic Server:\n";
        std::cout << "    -p, --port PORT           Server port (default: 8080)\n";
        std::cout << "    --host HOST               Server host (default: 0.0.0.0)\n";
        std::cout << "    -c, --config FILE         Load configuration from YAML file\n\n";

        std::cout << "  Logging:\n";
        std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n";
        std::cout << "    --log-file FILE           Also append log lines to FILE\n";
        std::cout << "    --quiet                   Suppress routine per-request messages\n\n";

        std::cout << "  Documents and Sessions:\n";
        std::cout << "    --max-chunk-size N        Maximum characters per chunk (default: 2000)\n";
        std::cout << "    --session-timeout SEC     Drop sessions idle this long, 0 = never (default: 3600)\n";
        std::cout << "    --max-sessions N          Maximum live sessions, 0 = unlimited (default: 0)\n";
        std::cout << "    --temp-dir DIR            Directory for spooled uploads\n\n";

        std::cout << "  Synthesis:\n";
        std::cout << "    --tts-url URL             Speech endpoint (default: http://127.0.0.1:5050/v1/audio/speech)\n";
        std::cout << "    --voice VOICE             Default voice (default: en-US-AriaNeural)\n\n";

        std::cout << "  Help:\n";
        std::cout << "    -h, --help                Show this help message\n";
        std::cout << "    -v, --version             Show version information\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "  # Basic server on port 3000\n";
        std::cout << "  lectern-server --port 3000\n\n";
        std::cout << "  # Load from configuration file\n";
        std::cout << "  lectern-server --config /path/to/config.yaml\n\n";
        std::cout << "  # Development mode with debug logging\n";
        std::cout << "  lectern-server --log-level DEBUG --session-timeout 120\n\n";
    }

    void ServerConfig::printVersion()
    {
        std::cout << "Lectern Server v1.0.0\n";
        std::cout << "Document chunking and text-to-speech reading sessions over HTTP\n";
    }

    const std::string &ServerConfig::getCurrentConfigFilePath() const
    {
        return currentConfigFilePath;
    }

} // namespace lectern
