#pragma once

#include <string>
#include <memory>

#include "export.hpp"
#include "server_config.hpp"
#include "document/document_processor.hpp"

namespace lectern
{

    namespace session
    {
        class SessionStore;
    }
    namespace synthesis
    {
        class ISpeechSynthesizer;
    }

    /**
     * @brief Owns the session store, the collaborators and the HTTP server.
     *
     * init() builds everything from the configuration, registers the routes and
     * starts the accept loop on a background thread.
     */
    class LECTERN_SERVER_API ServerAPI
    {
    public:
        static ServerAPI &instance();

        ServerAPI(const ServerAPI &) = delete;
        ServerAPI &operator=(const ServerAPI &) = delete;
        ServerAPI(ServerAPI &&) = delete;
        ServerAPI &operator=(ServerAPI &&) = delete;

        bool init(const ServerConfig &config);

        // Same as init(config) with the speech backend and document opener supplied by the caller.
        bool init(const ServerConfig &config,
                  std::unique_ptr<synthesis::ISpeechSynthesizer> synthesizer,
                  document::DocumentOpener opener = nullptr);

        void shutdown();

        session::SessionStore &getSessionStore();
        const session::SessionStore &getSessionStore() const;

    private:
        ServerAPI();
        ~ServerAPI();

        class Impl;
#pragma warning(push)
#pragma warning(disable: 4251)
        std::unique_ptr<Impl> pImpl;
#pragma warning(pop)
    };

} // namespace lectern
