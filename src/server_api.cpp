#include "lectern/server_api.hpp"
#include "lectern/server.hpp"
#include "lectern/routes/chunk_read_route.hpp"
#include "lectern/routes/document_upload_route.hpp"
#include "lectern/routes/health_status_route.hpp"
#include "lectern/routes/server_logs_route.hpp"
#include "lectern/routes/session_status_route.hpp"
#include "lectern/routes/synthesize_route.hpp"
#include "lectern/session/session_store.hpp"
#include "lectern/synthesis/http_speech_synthesizer.hpp"
#include "lectern/logger.hpp"
#include <memory>
#include <stdexcept>
#include <thread>

namespace lectern
{

    class ServerAPI::Impl
    {
    public:
        std::unique_ptr<session::SessionStore> sessions;
        std::unique_ptr<synthesis::ISpeechSynthesizer> synthesizer;
        std::unique_ptr<document::DocumentProcessor> processor;
        std::unique_ptr<Server> server;
        std::thread serverThread;
    };

    ServerAPI::ServerAPI() : pImpl(std::make_unique<Impl>()) {}

    ServerAPI::~ServerAPI()
    {
        shutdown();
    }

    ServerAPI &ServerAPI::instance()
    {
        static ServerAPI instance;
        return instance;
    }

    bool ServerAPI::init(const ServerConfig &config)
    {
        synthesis::HttpSpeechSynthesizer::Config synthConfig;
        synthConfig.url = config.synthesis.url;
        synthConfig.timeout = config.synthesis.timeout;
        synthConfig.apiKey = config.synthesis.apiKey;
        return init(config, std::make_unique<synthesis::HttpSpeechSynthesizer>(synthConfig));
    }

    bool ServerAPI::init(const ServerConfig &config,
                         std::unique_ptr<synthesis::ISpeechSynthesizer> synthesizer,
                         document::DocumentOpener opener)
    {
        if (pImpl->server)
        {
            ServerLogger::logWarning("Server already initialized");
            return false;
        }

        try
        {
            ServerLogger::logInfo("Initializing server on %s:%s", config.host.c_str(), config.port.c_str());

            pImpl->sessions = std::make_unique<session::SessionStore>(config.sessionIdleTimeout, config.maxSessions);
            pImpl->synthesizer = std::move(synthesizer);
            pImpl->processor = std::make_unique<document::DocumentProcessor>(
                config.tempDir, static_cast<size_t>(config.maxChunkSize), std::move(opener));
            ServerLogger::logInfo("Spooling uploads to %s", pImpl->processor->tempDirectory().string().c_str());

            pImpl->server = std::make_unique<Server>(config.port, config.host, config.maxUploadBytes);
            if (!pImpl->server->init())
            {
                ServerLogger::logError("Failed to initialize server");
                pImpl->server.reset();
                return false;
            }

            synthesis::SynthesisRequest voiceDefaults;
            voiceDefaults.voice = config.synthesis.voice;
            voiceDefaults.rate = config.synthesis.rate;
            voiceDefaults.volume = config.synthesis.volume;
            voiceDefaults.format = config.synthesis.format;

            ServerLogger::logInfo("Registering routes");
            pImpl->server->addRoute(std::make_unique<HealthStatusRoute>(*pImpl->sessions));
            pImpl->server->addRoute(std::make_unique<DocumentUploadRoute>(*pImpl->sessions, *pImpl->processor));
            pImpl->server->addRoute(std::make_unique<ChunkReadRoute>(*pImpl->sessions, *pImpl->synthesizer, voiceDefaults));
            pImpl->server->addRoute(std::make_unique<SessionStatusRoute>(*pImpl->sessions));
            pImpl->server->addRoute(std::make_unique<SynthesizeRoute>(*pImpl->synthesizer, voiceDefaults));
            pImpl->server->addRoute(std::make_unique<ServerLogsRoute>());
            ServerLogger::logInfo("Routes registered successfully");

            pImpl->sessions->startEviction();

            pImpl->serverThread = std::thread([this]()
                                              {
                ServerLogger::logInfo("Starting server main loop");
                pImpl->server->run(); });

            return true;
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Failed to initialize server: %s", ex.what());
            pImpl->server.reset();
            return false;
        }
    }

    void ServerAPI::shutdown()
    {
        if (!pImpl->server && !pImpl->sessions)
        {
            return;
        }

        if (pImpl->server)
        {
            ServerLogger::logInfo("Shutting down HTTP server");
            pImpl->server->stop();
            if (pImpl->serverThread.joinable())
            {
                pImpl->serverThread.join();
            }
            // Returns once every in-flight request has been answered
            pImpl->server.reset();
        }

        if (pImpl->sessions)
        {
            pImpl->sessions->stopEviction();
            ServerLogger::logInfo("Dropping %zu sessions", pImpl->sessions->size());
        }
        pImpl->sessions.reset();
        pImpl->processor.reset();
        pImpl->synthesizer.reset();
        ServerLogger::logInfo("Server shutdown complete");
    }

    session::SessionStore &ServerAPI::getSessionStore()
    {
        if (!pImpl->sessions)
        {
            throw std::runtime_error("Server not initialized - call init() first");
        }
        return *pImpl->sessions;
    }

    const session::SessionStore &ServerAPI::getSessionStore() const
    {
        if (!pImpl->sessions)
        {
            throw std::runtime_error("Server not initialized - call init() first");
        }
        return *pImpl->sessions;
    }

} // namespace lectern
